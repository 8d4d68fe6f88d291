#ifndef PCBPLACE_BOARD_TYPES_H
#define PCBPLACE_BOARD_TYPES_H

#include <cstdint>
#include <string>

namespace board {

enum class BoardSide : std::uint8_t { Front = 0, Back = 1 };

// Footprint library entry. Outline, pins and keepouts live with the library;
// placement only needs a stable reference to it.
struct Package {
    std::uint32_t id;
    std::string name;
};

} // namespace board

#endif // PCBPLACE_BOARD_TYPES_H
