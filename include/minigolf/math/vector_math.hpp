/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics library
 *
 * This file provides the geometric primitives used by the golf kernel:
 * - Vector class for direction and magnitude calculations
 * - Position class for point locations on the playfield
 * - Reflection about a surface normal
 * - Closest point on a line segment
 */

#ifndef MINIGOLF_VECTOR_MATH_HPP
#define MINIGOLF_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Utility function for safe square root computation
 *
 * @param d Input value
 * @return double Square root of input, warns if input is negative
 */
double my_sqrt(double d);

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Represents a 2D point on the playfield
 *
 * Position is used for absolute locations. Subtracting two positions
 * yields the Vector between them; adding a Vector moves the point.
 * Conversion to Vector goes through Vector's converting constructor.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    /**
     * @brief Moves the position by a displacement
     * @param v Displacement to add
     * @return New position
     */
    Position operator+(const Vector& v) const;

    /**
     * @brief Displacement from another position to this one
     * @param p Origin position
     * @return Vector pointing from p to this position
     */
    Vector operator-(const Position& p) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    /**
     * @brief Moves this position by a displacement
     * @param v Displacement to add
     * @return Reference to this position
     */
    Position& operator+=(const Vector& v);

    bool operator==(const Position& p) const;
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 *
 * Vector class provides the 2D vector operations needed for
 * integration and collision response.
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /**
     * @brief Constructs a vector from a position
     * @param p Position to convert
     */
    Vector(const Position& p);

    /** @brief Converts Vector to Position */
    operator Position() const;

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    /**
     * @brief Adds two vectors
     * @param v Vector to add
     * @return Sum vector
     */
    Vector operator+(const Vector& b) const;

    /**
     * @brief Subtracts two vectors
     * @param v Vector to subtract
     * @return Difference vector
     */
    Vector operator-(const Vector& b) const;

    /**
     * @brief Scales vector by scalar value
     * @param scalar Scale factor
     * @return Scaled vector
     */
    Vector operator*(double scalar) const;

    /**
     * @brief Divides vector by scalar value
     * @param scalar Divisor
     * @return Divided vector
     */
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude (no square root) */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * Any non-zero vector keeps its direction, however short. Only the
     * exact zero vector falls back to (1,0).
     */
    Vector normalized() const;

    /**
     * @brief Reflects this vector about a surface normal
     *
     * Computes v - 2 (v.n) n. The normal is expected to be unit length.
     *
     * @param normal Unit normal of the reflecting surface
     * @return Reflected vector
     */
    Vector reflect(const Vector& normal) const;

    /**
     * @brief Adds another vector to this one
     * @param v Vector to add
     * @return Reference to this vector
     */
    Vector& operator+=(const Vector& v);

    /**
     * @brief Subtracts another vector from this one
     * @param v Vector to subtract
     * @return Reference to this vector
     */
    Vector& operator-=(const Vector& v);

    /**
     * @brief Scales this vector in place
     * @param scalar Scale factor
     * @return Reference to this vector
     */
    Vector& operator*=(double scalar);

    bool operator==(const Vector& v) const;
};

/**
 * @brief Finds closest point on line segment to a point
 *
 * The scalar projection of (p - a) onto (b - a) is clamped to [0, 1].
 * A zero-length segment returns a.
 *
 * @param a Start point of line segment
 * @param b End point of line segment
 * @param p Point to find closest position to
 * @return Vector Position of closest point on line segment ab
 */
Vector closestPointOnLine(const Vector &a, const Vector &b, const Vector &p);

#endif // MINIGOLF_VECTOR_MATH_HPP
