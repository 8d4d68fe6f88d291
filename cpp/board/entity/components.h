#pragma once

#include "board/core/geometry.h"
#include "board/core/types.h"
#include "board/entity/component.h"
#include "board/history/undo_log.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace board {

class BoardObservers;

// The components placed on a board, addressed by component number.
//
// Slot n-1 of the array holds component n. Edits go through the undo log
// before they touch the component; undo and redo write the instances the
// log replays back into their slots.
class Components {
public:
    Components() = default;
    Components(const Components&) = delete;
    Components& operator=(const Components&) = delete;

    // Returned handles share ownership, so they stay valid across undo and
    // redo. After an undo or redo the handle for a number may no longer be the
    // live instance; look it up again with get().

    // The items of the component are inserted into the board separately.
    // packageBack is used while the component sits on the back side.
    std::shared_ptr<const Component> add(std::string name, const IntPoint& location, double rotationInDegree, bool onFront,
                         const Package* packageFront, const Package* packageBack, bool positionFixed);

    // Generates the name "Component#<number>" and uses package on both sides.
    std::shared_ptr<const Component> add(const IntPoint& location, double rotationInDegree, bool onFront, const Package* package);

    // First component with this name, or nullptr.
    std::shared_ptr<const Component> findByName(std::string_view name) const;

    // Throws std::out_of_range unless 1 <= componentNo <= count().
    std::shared_ptr<const Component> get(std::uint32_t componentNo) const;

    // False once the creation of the component was undone.
    bool isLive(std::uint32_t componentNo) const;

    std::uint32_t count() const noexcept { return static_cast<std::uint32_t>(componentArr_.size()); }

    // Numbers whose slot holds a component with a different number.
    std::vector<std::uint32_t> inconsistentNumbers() const;

    void generateSnapshot();
    bool undo(BoardObservers* observers = nullptr);
    bool redo(BoardObservers* observers = nullptr);
    bool canUndo() const noexcept { return undoLog_.canUndo(); }
    bool canRedo() const noexcept { return undoLog_.canRedo(); }

    // Undoable counterparts of the Component transforms.
    void move(std::uint32_t componentNo, const IntVector& vector);
    void turn90Degree(std::uint32_t componentNo, int factor, const IntPoint& pole);
    void rotate(std::uint32_t componentNo, double rotationInDegree, const IntPoint& pole);
    void changeSide(std::uint32_t componentNo, const IntPoint& pole);

    // If true, components on the back side are rotated before mirroring,
    // else they are mirrored before rotating. Applies to later rotate() calls.
    bool getFlipStyleRotateFirst() const noexcept { return flipStyleRotateFirst_; }
    void setFlipStyleRotateFirst(bool value) noexcept { flipStyleRotateFirst_ = value; }

private:
    friend class ComponentsTestAccessor;

    const std::shared_ptr<Component>& slot(std::uint32_t componentNo) const;
    void restoreComponentArrFromUndoLog(BoardObservers* observers);

    UndoLog<Component> undoLog_;
    std::vector<std::shared_ptr<Component>> componentArr_;
    bool flipStyleRotateFirst_ = false;
};

} // namespace board
