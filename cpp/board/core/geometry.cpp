#include "board/core/geometry.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace board {

namespace {
constexpr double kPi = 3.14159265358979323846;

std::int32_t toCoordinate(std::int64_t v, const char* op) {
    if (v > maxCoordinate || v < -maxCoordinate) {
        throw std::out_of_range(std::string(op) + ": coordinate " + std::to_string(v) + " outside board limits");
    }
    return static_cast<std::int32_t>(v);
}

IntPoint makePoint(std::int64_t x, std::int64_t y, const char* op) {
    return IntPoint{toCoordinate(x, op), toCoordinate(y, op)};
}
} // namespace

IntPoint translate(const IntPoint& p, const IntVector& v) {
    return makePoint(std::int64_t{p.x} + v.x, std::int64_t{p.y} + v.y, "translate");
}

IntPoint turn90Degree(const IntPoint& p, int factor, const IntPoint& pole) {
    factor %= 4;
    if (factor < 0) factor += 4;
    const std::int64_t dx = std::int64_t{p.x} - pole.x;
    const std::int64_t dy = std::int64_t{p.y} - pole.y;
    switch (factor) {
        case 1: return makePoint(pole.x - dy, pole.y + dx, "turn90Degree");
        case 2: return makePoint(pole.x - dx, pole.y - dy, "turn90Degree");
        case 3: return makePoint(pole.x + dy, pole.y - dx, "turn90Degree");
        default: return p;
    }
}

IntPoint rotate(const IntPoint& p, double degrees, const IntPoint& pole) {
    const double rad = degrees * kPi / 180.0;
    const double c = std::cos(rad);
    const double s = std::sin(rad);
    const double dx = static_cast<double>(p.x) - pole.x;
    const double dy = static_cast<double>(p.y) - pole.y;
    return roundToInt(FloatPoint{pole.x + dx * c - dy * s, pole.y + dx * s + dy * c});
}

IntPoint mirrorVertical(const IntPoint& p, const IntPoint& pole) {
    return makePoint(2 * std::int64_t{pole.x} - p.x, p.y, "mirrorVertical");
}

IntPoint roundToInt(const FloatPoint& p) {
    const double limit = static_cast<double>(maxCoordinate) + 0.5;
    if (!(std::fabs(p.x) < limit) || !(std::fabs(p.y) < limit)) {
        throw std::out_of_range("roundToInt: point outside board limits");
    }
    return IntPoint{static_cast<std::int32_t>(std::lround(p.x)), static_cast<std::int32_t>(std::lround(p.y))};
}

double normalizeDegrees(double degrees) noexcept {
    double result = std::fmod(degrees, 360.0);
    if (result < 0.0) result += 360.0;
    if (result >= 360.0) result = 0.0;
    return result;
}

} // namespace board
