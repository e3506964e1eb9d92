#pragma once

#include <cmath>

namespace ogcode::core {

// A planar position.
// - machine space: millimetres, origin at the optical axis
// - scanner space: XY2-100 digital units (0..65535, 0x8000 = centre)
struct Point2 {
    double x = 0.0;
    double y = 0.0;
};

inline Point2 operator+(Point2 a, Point2 b) { return {a.x + b.x, a.y + b.y}; }
inline Point2 operator-(Point2 a, Point2 b) { return {a.x - b.x, a.y - b.y}; }
inline Point2 operator*(Point2 a, double s) { return {a.x * s, a.y * s}; }
inline Point2 operator*(double s, Point2 a) { return {a.x * s, a.y * s}; }

inline bool operator==(Point2 a, Point2 b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Point2 a, Point2 b) { return !(a == b); }

inline double dot(Point2 a, Point2 b) { return a.x * b.x + a.y * b.y; }
inline double length(Point2 a) { return std::hypot(a.x, a.y); }
inline double distance(Point2 a, Point2 b) { return length(b - a); }

inline bool isFinite(Point2 p) { return std::isfinite(p.x) && std::isfinite(p.y); }

} // namespace ogcode::core
