#ifndef POLYSEQ_CORE_MATH_UTILS_H
#define POLYSEQ_CORE_MATH_UTILS_H

#include "polyseq/core/types.h"

#include <cmath>
#include <cstdint>
#include <utility>

namespace polyseq {

static constexpr double kPi = 3.14159265358979323846;
static constexpr double kTwoPi = 2.0 * kPi;

inline double degToRad(double deg) noexcept { return deg * kPi / 180.0; }
inline double radToDeg(double rad) noexcept { return rad * 180.0 / kPi; }

inline std::int64_t gcd(std::int64_t a, std::int64_t b) noexcept {
    a = a < 0 ? -a : a;
    b = b < 0 ? -b : b;
    while (b != 0) {
        const std::int64_t t = b;
        b = a % b;
        a = t;
    }
    return a;
}

inline Point2 sub(const Point2& a, const Point2& b) noexcept { return Point2{a.x - b.x, a.y - b.y}; }
inline Point2 add(const Point2& a, const Point2& b) noexcept { return Point2{a.x + b.x, a.y + b.y}; }
inline Point2 mul(const Point2& a, double s) noexcept { return Point2{a.x * s, a.y * s}; }
inline double dot(const Point2& a, const Point2& b) noexcept { return a.x * b.x + a.y * b.y; }
inline double cross(const Point2& a, const Point2& b) noexcept { return a.x * b.y - a.y * b.x; }
inline double len2(const Point2& v) noexcept { return dot(v, v); }
inline double len(const Point2& v) noexcept { return std::sqrt(len2(v)); }
inline double distance(const Point2& a, const Point2& b) noexcept { return len(sub(a, b)); }

// Counter-clockwise rotation about the origin.
inline Point2 rotate(const Point2& p, double radians) noexcept {
    const double c = std::cos(radians);
    const double s = std::sin(radians);
    return Point2{p.x * c - p.y * s, p.x * s + p.y * c};
}

// Fixed-precision identity used for point deduplication.
inline std::pair<std::int64_t, std::int64_t> pointKey(const Point2& p) noexcept {
    return {
        static_cast<std::int64_t>(std::llround(p.x / kPointKeyPrecision)),
        static_cast<std::int64_t>(std::llround(p.y / kPointKeyPrecision))
    };
}

inline double distanceToSegment(const Point2& p, const Point2& a, const Point2& b) noexcept {
    const Point2 ab = sub(b, a);
    const double l2 = len2(ab);
    if (l2 == 0.0) return distance(p, a);
    double t = dot(sub(p, a), ab) / l2;
    t = t < 0.0 ? 0.0 : (t > 1.0 ? 1.0 : t);
    return distance(p, add(a, mul(ab, t)));
}

} // namespace polyseq

#endif // POLYSEQ_CORE_MATH_UTILS_H
