#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "board/entity/components.h"

#include <cstdint>
#include <string>
#include <utility>

#ifdef EMSCRIPTEN
namespace {

// Plain copy of a component for the JS side. Packages stay on the C++ side.
struct ComponentInfo {
    std::string name;
    std::uint32_t number;
    std::int32_t x;
    std::int32_t y;
    double rotation;
    bool onFront;
    bool positionFixed;
    bool live;
};

ComponentInfo makeInfo(const board::Components& components, const board::Component& c) {
    return ComponentInfo{
        c.getName(),
        c.getNumber(),
        c.getLocation().x,
        c.getLocation().y,
        c.getRotationInDegree(),
        c.isOnFront(),
        c.isPositionFixed(),
        components.isLive(c.getNumber())};
}

} // namespace

EMSCRIPTEN_BINDINGS(pcbplace_board_module) {
    emscripten::value_object<ComponentInfo>("ComponentInfo")
        .field("name", &ComponentInfo::name)
        .field("number", &ComponentInfo::number)
        .field("x", &ComponentInfo::x)
        .field("y", &ComponentInfo::y)
        .field("rotation", &ComponentInfo::rotation)
        .field("onFront", &ComponentInfo::onFront)
        .field("positionFixed", &ComponentInfo::positionFixed)
        .field("live", &ComponentInfo::live);

    emscripten::class_<board::Components>("Components")
        .constructor<>()
        .function("add", emscripten::optional_override([](board::Components& self, std::string name, std::int32_t x, std::int32_t y, double rotation, bool onFront, bool positionFixed) {
            return self.add(std::move(name), board::IntPoint{x, y}, rotation, onFront, nullptr, nullptr, positionFixed)->getNumber();
        }))
        .function("addUnnamed", emscripten::optional_override([](board::Components& self, std::int32_t x, std::int32_t y, double rotation, bool onFront) {
            return self.add(board::IntPoint{x, y}, rotation, onFront, nullptr)->getNumber();
        }))
        .function("get", emscripten::optional_override([](const board::Components& self, std::uint32_t componentNo) {
            return makeInfo(self, *self.get(componentNo));
        }))
        .function("findByName", emscripten::optional_override([](const board::Components& self, std::string name) {
            const auto c = self.findByName(name);
            if (!c) return emscripten::val::null();
            return emscripten::val(makeInfo(self, *c));
        }))
        .function("count", &board::Components::count)
        .function("move", emscripten::optional_override([](board::Components& self, std::uint32_t componentNo, std::int32_t dx, std::int32_t dy) {
            self.move(componentNo, board::IntVector{dx, dy});
        }))
        .function("turn90Degree", emscripten::optional_override([](board::Components& self, std::uint32_t componentNo, int factor, std::int32_t poleX, std::int32_t poleY) {
            self.turn90Degree(componentNo, factor, board::IntPoint{poleX, poleY});
        }))
        .function("rotate", emscripten::optional_override([](board::Components& self, std::uint32_t componentNo, double rotation, std::int32_t poleX, std::int32_t poleY) {
            self.rotate(componentNo, rotation, board::IntPoint{poleX, poleY});
        }))
        .function("changeSide", emscripten::optional_override([](board::Components& self, std::uint32_t componentNo, std::int32_t poleX, std::int32_t poleY) {
            self.changeSide(componentNo, board::IntPoint{poleX, poleY});
        }))
        .function("generateSnapshot", &board::Components::generateSnapshot)
        .function("undo", emscripten::optional_override([](board::Components& self) { return self.undo(nullptr); }))
        .function("redo", emscripten::optional_override([](board::Components& self) { return self.redo(nullptr); }))
        .function("canUndo", &board::Components::canUndo)
        .function("canRedo", &board::Components::canRedo)
        .function("getFlipStyleRotateFirst", &board::Components::getFlipStyleRotateFirst)
        .function("setFlipStyleRotateFirst", &board::Components::setFlipStyleRotateFirst);
}
#endif
