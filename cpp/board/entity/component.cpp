#include "board/entity/component.h"

#include <utility>

namespace board {

Component::Component(std::string name, IntPoint location, double rotationInDegree, bool onFront,
                     const Package* packageFront, const Package* packageBack,
                     std::uint32_t number, bool positionFixed)
    : name_(std::move(name)),
      location_(location),
      rotationInDegree_(normalizeDegrees(rotationInDegree)),
      onFront_(onFront),
      packageFront_(packageFront),
      packageBack_(packageBack),
      number_(number),
      positionFixed_(positionFixed) {}

void Component::translateBy(const IntVector& vector) {
    location_ = translate(location_, vector);
}

void Component::turn90Degree(int factor, const IntPoint& pole) {
    factor %= 4;
    if (factor < 0) factor += 4;
    location_ = board::turn90Degree(location_, factor, pole);
    rotationInDegree_ = normalizeDegrees(rotationInDegree_ + factor * 90.0);
}

void Component::rotate(double rotationInDegree, const IntPoint& pole, bool flipStyleRotateFirst) {
    const IntPoint location = board::rotate(location_, rotationInDegree, pole);
    double turnAngle = rotationInDegree;
    if (flipStyleRotateFirst && !onFront_) {
        turnAngle = 360.0 - rotationInDegree;
    }
    rotationInDegree_ = normalizeDegrees(rotationInDegree_ + turnAngle);
    location_ = location;
}

void Component::changeSide(const IntPoint& pole) {
    location_ = mirrorVertical(location_, pole);
    onFront_ = !onFront_;
}

} // namespace board
