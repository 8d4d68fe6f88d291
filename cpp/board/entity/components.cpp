#include "board/entity/components.h"
#include "board/core/logging.h"
#include "board/entity/board_observers.h"

#include <stdexcept>
#include <utility>

namespace board {

std::shared_ptr<const Component> Components::add(std::string name, const IntPoint& location, double rotationInDegree, bool onFront,
                                 const Package* packageFront, const Package* packageBack, bool positionFixed) {
    auto component = std::make_shared<Component>(
        std::move(name), location, rotationInDegree, onFront, packageFront, packageBack,
        count() + 1, positionFixed);
    componentArr_.push_back(component);
    undoLog_.insert(component);
    return component;
}

std::shared_ptr<const Component> Components::add(const IntPoint& location, double rotationInDegree, bool onFront, const Package* package) {
    std::string name = "Component#" + std::to_string(count() + 1);
    return add(std::move(name), location, rotationInDegree, onFront, package, package, false);
}

std::shared_ptr<const Component> Components::findByName(std::string_view name) const {
    for (const auto& component : componentArr_) {
        if (component->getName() == name) return component;
    }
    return nullptr;
}

const std::shared_ptr<Component>& Components::slot(std::uint32_t componentNo) const {
    if (componentNo < 1 || componentNo > componentArr_.size()) {
        throw std::out_of_range(
            "Components::get: component number " + std::to_string(componentNo)
            + " outside 1.." + std::to_string(componentArr_.size()));
    }
    const auto& result = componentArr_[componentNo - 1];
    if (result->getNumber() != componentNo) {
        BOARD_LOG_WARN("Components::get: inconsistent component number %u (slot holds %u)",
            componentNo, result->getNumber());
    }
    return result;
}

std::shared_ptr<const Component> Components::get(std::uint32_t componentNo) const {
    return slot(componentNo);
}

bool Components::isLive(std::uint32_t componentNo) const {
    return undoLog_.contains(*slot(componentNo));
}

std::vector<std::uint32_t> Components::inconsistentNumbers() const {
    std::vector<std::uint32_t> result;
    for (std::size_t i = 0; i < componentArr_.size(); ++i) {
        const std::uint32_t expected = static_cast<std::uint32_t>(i + 1);
        if (componentArr_[i]->getNumber() != expected) result.push_back(expected);
    }
    return result;
}

void Components::generateSnapshot() {
    undoLog_.generateSnapshot();
}

bool Components::undo(BoardObservers* observers) {
    if (!undoLog_.undo(nullptr, nullptr)) {
        BOARD_LOG_DEBUG("Components::undo: no earlier snapshot");
        return false;
    }
    restoreComponentArrFromUndoLog(observers);
    return true;
}

bool Components::redo(BoardObservers* observers) {
    if (!undoLog_.redo(nullptr, nullptr)) {
        BOARD_LOG_DEBUG("Components::redo: no later snapshot");
        return false;
    }
    restoreComponentArrFromUndoLog(observers);
    return true;
}

void Components::restoreComponentArrFromUndoLog(BoardObservers* observers) {
    std::size_t replayed = 0;
    auto it = undoLog_.startReadObject();
    for (;;) {
        std::shared_ptr<Component> current = undoLog_.readObject(it);
        if (!current) break;
        componentArr_[current->getNumber() - 1] = current;
        replayed++;
        if (observers) observers->notifyMoved(*current);
    }
    BOARD_LOG_DEBUG("Components: restored %zu components at stack level %zu",
        replayed, undoLog_.getStackLevel());
}

void Components::move(std::uint32_t componentNo, const IntVector& vector) {
    Component& component = *slot(componentNo);
    undoLog_.saveForUndo(component);
    component.translateBy(vector);
}

void Components::turn90Degree(std::uint32_t componentNo, int factor, const IntPoint& pole) {
    Component& component = *slot(componentNo);
    undoLog_.saveForUndo(component);
    component.turn90Degree(factor, pole);
}

void Components::rotate(std::uint32_t componentNo, double rotationInDegree, const IntPoint& pole) {
    Component& component = *slot(componentNo);
    undoLog_.saveForUndo(component);
    component.rotate(rotationInDegree, pole, flipStyleRotateFirst_);
}

void Components::changeSide(std::uint32_t componentNo, const IntPoint& pole) {
    Component& component = *slot(componentNo);
    undoLog_.saveForUndo(component);
    component.changeSide(pole);
}

} // namespace board
