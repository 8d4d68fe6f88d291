#pragma once

#include "board/core/geometry.h"
#include "board/core/types.h"

#include <cstdint>
#include <string>

namespace board {

// A placed component instance. Edits that must be undoable go through
// Components; the transforms here apply in place without history.
class Component {
public:
    Component(std::string name, IntPoint location, double rotationInDegree, bool onFront,
              const Package* packageFront, const Package* packageBack,
              std::uint32_t number, bool positionFixed);

    const std::string& getName() const noexcept { return name_; }
    std::uint32_t getNumber() const noexcept { return number_; }
    IntPoint getLocation() const noexcept { return location_; }
    double getRotationInDegree() const noexcept { return rotationInDegree_; }
    BoardSide getSide() const noexcept { return onFront_ ? BoardSide::Front : BoardSide::Back; }
    bool isOnFront() const noexcept { return onFront_; }
    bool isPositionFixed() const noexcept { return positionFixed_; }

    // Package used on the current side.
    const Package* getPackage() const noexcept { return onFront_ ? packageFront_ : packageBack_; }
    const Package* getPackageFront() const noexcept { return packageFront_; }
    const Package* getPackageBack() const noexcept { return packageBack_; }

    void translateBy(const IntVector& vector);
    void turn90Degree(int factor, const IntPoint& pole);

    // On the back side with flipStyleRotateFirst the component was rotated
    // before mirroring, so its stored rotation turns the other way.
    void rotate(double rotationInDegree, const IntPoint& pole, bool flipStyleRotateFirst);

    // Toggles the side and mirrors the location at the vertical line through pole.
    void changeSide(const IntPoint& pole);

private:
    std::string name_;
    IntPoint location_;
    double rotationInDegree_;
    bool onFront_;
    const Package* packageFront_;
    const Package* packageBack_;
    std::uint32_t number_;
    bool positionFixed_;
};

} // namespace board
