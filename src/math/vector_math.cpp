#include "minigolf/math/vector_math.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

double my_sqrt(double d) {
  if (d < 0) {
    std::cerr << "Warning: sqrt of negative value " << d << std::endl;
  }
  return std::sqrt(d);
}

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y};
}

Vector Position::operator-(const Position& p) const {
  return {this->x - p.x, this->y - p.y};
}

double Position::dist(const Position& p) const {
	double const dx = this->x - p.x;
	double const dy = this->y - p.y;
	return my_sqrt(dx * dx + dy * dy);
}

Position& Position::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

bool Position::operator==(const Position& p) const {
  return this->x == p.x && this->y == p.y;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector::operator Position() const {
  return {this->x, this->y};
}

Vector Vector::operator-() const {
    return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

double Vector::length() const {
	return my_sqrt(this->x * this->x + this->y * this->y);
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
	return this->x * v.x + this->y * v.y;
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len == 0.0) {
    // default direction if zero-length vector
    return Vector(1.0, 0.0);
  }
  return {this->x / len, this->y / len};
}

Vector Vector::reflect(const Vector& normal) const {
  double const vn = this->dotProduct(normal);
  return {this->x - 2.0 * vn * normal.x, this->y - 2.0 * vn * normal.y};
}

Vector closestPointOnLine(const Vector &a, const Vector &b, const Vector &p) {
  Vector const ab = b - a;
  double const denom = ab.dotProduct(ab);
  if (denom == 0.0) { return a;
}
  double t = ((p.x - a.x)*ab.x + (p.y - a.y)*ab.y) / denom;
  t = std::max(0.0,std::min(1.0,t));
  return {a.x + ab.x*t, a.y + ab.y*t};
}

// Vector operators
Vector& Vector::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    this->x -= v.x;
    this->y -= v.y;
    return *this;
}

Vector& Vector::operator*=(double scalar) {
    this->x *= scalar;
    this->y *= scalar;
    return *this;
}

bool Vector::operator==(const Vector& v) const {
  return this->x == v.x && this->y == v.y;
}
