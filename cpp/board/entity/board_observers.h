#pragma once

namespace board {

class Component;

// Receives the components touched by an undo or redo. Called synchronously;
// implementations must not call back into the registry.
class BoardObservers {
public:
    virtual ~BoardObservers() = default;

    virtual void notifyMoved(const Component& component) = 0;
};

} // namespace board
