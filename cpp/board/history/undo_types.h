#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace board {

// One tracked object inside an undo entry.
template <typename T>
struct UndoObjectChange {
    std::uint32_t key;
    std::shared_ptr<T> before; // instance live at the boundary, null if it did not exist
    std::shared_ptr<T> after;  // instance live when the entry was last undone
};

// Everything recorded between two snapshot boundaries.
template <typename T>
struct UndoEntry {
    std::vector<UndoObjectChange<T>> objects;
    std::unordered_map<std::uint32_t, std::size_t> objectIndex;
};

} // namespace board
