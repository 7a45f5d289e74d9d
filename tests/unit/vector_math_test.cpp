#include <gtest/gtest.h>
#include "minigolf/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);  // Parameterized constructor
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorArithmetic) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector sum = v1 + v2;
    EXPECT_DOUBLE_EQ(sum.x, 4.0);
    EXPECT_DOUBLE_EQ(sum.y, 6.0);

    Vector diff = v2 - v1;
    EXPECT_DOUBLE_EQ(diff.x, 2.0);
    EXPECT_DOUBLE_EQ(diff.y, 2.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);

    v1 *= 0.5;
    EXPECT_DOUBLE_EQ(v1.x, 2.0);
    EXPECT_DOUBLE_EQ(v1.y, 3.0);
}

TEST(VectorMathTest, LengthAndNormalize) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 25.0);

    Vector n = v.normalized();
    EXPECT_DOUBLE_EQ(n.length(), 1.0);
    EXPECT_DOUBLE_EQ(n.x, 0.6);
    EXPECT_DOUBLE_EQ(n.y, 0.8);

    // Zero vector falls back to a default direction
    Vector zero;
    Vector fallback = zero.normalized();
    EXPECT_DOUBLE_EQ(fallback.x, 1.0);
    EXPECT_DOUBLE_EQ(fallback.y, 0.0);
}

TEST(VectorMathTest, TinyVectorKeepsItsDirection) {
    Vector down = Vector(0.0, -1e-10).normalized();
    EXPECT_DOUBLE_EQ(down.x, 0.0);
    EXPECT_DOUBLE_EQ(down.y, -1.0);

    Vector left = Vector(-1e-12, 0.0).normalized();
    EXPECT_DOUBLE_EQ(left.x, -1.0);
    EXPECT_DOUBLE_EQ(left.y, 0.0);
}

TEST(VectorMathTest, DotProduct) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v1.dotProduct(v2), 11.0);  // 1*3 + 2*4
}

TEST(VectorMathTest, ReflectFlipsNormalComponentOnly) {
    Vector v(3.0, -5.0);
    Vector n(0.0, 1.0);

    Vector r = v.reflect(n);
    EXPECT_DOUBLE_EQ(r.x, 3.0);
    EXPECT_DOUBLE_EQ(r.y, 5.0);

    // Diagonal wall
    Vector d(1.0, 0.0);
    Vector diagonal = Vector(1.0, 1.0).normalized();
    Vector rd = d.reflect(diagonal);
    EXPECT_NEAR(rd.x, 0.0, EPSILON);
    EXPECT_NEAR(rd.y, -1.0, EPSILON);
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0);

    Vector between = p2 - p1;
    EXPECT_DOUBLE_EQ(between.x, 2.0);
    EXPECT_DOUBLE_EQ(between.y, 2.0);

    Position moved = p1 + Vector(1.0, -1.0);
    EXPECT_DOUBLE_EQ(moved.x, 2.0);
    EXPECT_DOUBLE_EQ(moved.y, 1.0);

    EXPECT_DOUBLE_EQ(p1.dist(p2), 2.8284271247461903);  // sqrt(8)
}

TEST(VectorMathTest, VectorPositionConversion) {
    Position p(1.0, 2.0);
    Vector v(p);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);

    Vector v2(3.0, 4.0);
    Position p2 = static_cast<Position>(v2);
    EXPECT_DOUBLE_EQ(p2.x, 3.0);
    EXPECT_DOUBLE_EQ(p2.y, 4.0);
}

TEST(VectorMathTest, ClosestPointOnLineClampsToSegment) {
    Vector a(0.0, 0.0);
    Vector b(10.0, 0.0);

    Vector inside = closestPointOnLine(a, b, Vector(4.0, 3.0));
    EXPECT_DOUBLE_EQ(inside.x, 4.0);
    EXPECT_DOUBLE_EQ(inside.y, 0.0);

    Vector beforeStart = closestPointOnLine(a, b, Vector(-5.0, 2.0));
    EXPECT_DOUBLE_EQ(beforeStart.x, 0.0);
    EXPECT_DOUBLE_EQ(beforeStart.y, 0.0);

    Vector pastEnd = closestPointOnLine(a, b, Vector(15.0, -2.0));
    EXPECT_DOUBLE_EQ(pastEnd.x, 10.0);
    EXPECT_DOUBLE_EQ(pastEnd.y, 0.0);

    // Degenerate segment
    Vector point = closestPointOnLine(a, a, Vector(3.0, 3.0));
    EXPECT_DOUBLE_EQ(point.x, 0.0);
    EXPECT_DOUBLE_EQ(point.y, 0.0);
}
