#ifndef MINIGOLF_COMPONENTS_BASIC_HPP
#define MINIGOLF_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "minigolf/math/vector_math.hpp" // for Position, Vector

namespace Components {

    enum class ShapeType {
        Circle,
        Polygon
    };

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    // Position at the start of the current tick, captured before integration
    struct PreviousPosition {
        ::Position value;
    };

    struct Radius {
        double value;
    };

    // Fraction of velocity retained per second of rolling
    struct Friction {
        double value;
    };

    // Shape Component
    // For circle: size = radius
    // For polygon: size is unused, vertices live in a PolygonShape
    struct Shape {
        ShapeType type;
        double size;
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

} // namespace Components

#endif // MINIGOLF_COMPONENTS_BASIC_HPP
