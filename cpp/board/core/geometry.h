#ifndef PCBPLACE_BOARD_GEOMETRY_H
#define PCBPLACE_BOARD_GEOMETRY_H

#include <cstdint>

namespace board {

// Board coordinates are integer units bounded by maxCoordinate in magnitude.
// Transforms whose result leaves that range throw std::out_of_range.
static constexpr std::int32_t maxCoordinate = (1 << 25) - 1;

struct IntPoint { std::int32_t x; std::int32_t y; };
struct IntVector { std::int32_t x; std::int32_t y; };
struct FloatPoint { double x; double y; };

inline bool operator==(const IntPoint& a, const IntPoint& b) noexcept { return a.x == b.x && a.y == b.y; }

IntPoint translate(const IntPoint& p, const IntVector& v);

// Counter-clockwise by factor * 90 degrees around pole. Any factor is accepted.
IntPoint turn90Degree(const IntPoint& p, int factor, const IntPoint& pole);

// Counter-clockwise by an arbitrary angle around pole, rounded to the nearest point.
IntPoint rotate(const IntPoint& p, double degrees, const IntPoint& pole);

// Mirror at the vertical line through pole.
IntPoint mirrorVertical(const IntPoint& p, const IntPoint& pole);

IntPoint roundToInt(const FloatPoint& p);

// Maps into [0, 360).
double normalizeDegrees(double degrees) noexcept;

} // namespace board

#endif // PCBPLACE_BOARD_GEOMETRY_H
