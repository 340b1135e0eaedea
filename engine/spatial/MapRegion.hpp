#pragma once

#include <glm/glm.hpp>
#include <string>
#include <variant>

namespace Hillkeeper {

/**
 * @brief Axis-aligned rectangle on the map x/z plane
 *
 * bottom is the minimum z, top the maximum z.
 */
struct RectArea {
    float left = 0.0f;
    float right = 0.0f;
    float top = 0.0f;
    float bottom = 0.0f;

    bool operator==(const RectArea&) const = default;
};

/**
 * @brief Circle on the map x/z plane
 */
struct CircleArea {
    glm::vec2 center{0.0f, 0.0f};
    float radius = 0.0f;

    bool operator==(const CircleArea& other) const {
        return center.x == other.center.x && center.y == other.center.y && radius == other.radius;
    }
};

/**
 * @brief Named map area: a start box or the hill
 *
 * Immutable after construction. All containment tests are inclusive of
 * the boundary.
 */
class MapRegion {
public:
    using Shape = std::variant<RectArea, CircleArea>;

    MapRegion() = default;
    explicit MapRegion(RectArea rect) : m_shape(rect) {}
    explicit MapRegion(CircleArea circle) : m_shape(circle) {}

    [[nodiscard]] static MapRegion Rect(float left, float top, float right, float bottom) {
        return MapRegion(RectArea{left, right, top, bottom});
    }

    [[nodiscard]] static MapRegion Circle(float x, float z, float radius) {
        return MapRegion(CircleArea{glm::vec2(x, z), radius});
    }

    /**
     * @brief Test whether a map position lies inside the region
     */
    [[nodiscard]] bool ContainsPoint(float x, float z) const;
    [[nodiscard]] bool ContainsPoint(const glm::vec2& xz) const { return ContainsPoint(xz.x, xz.y); }

    /**
     * @brief Test whether a building footprint lies entirely inside the region
     * @param x Footprint center x
     * @param z Footprint center z
     * @param sizeX Footprint width along x
     * @param sizeZ Footprint depth along z
     *
     * For circles only the four footprint corners are tested.
     */
    [[nodiscard]] bool ContainsFootprint(float x, float z, float sizeX, float sizeZ) const;

    [[nodiscard]] const Shape& GetShape() const noexcept { return m_shape; }
    [[nodiscard]] bool IsRect() const noexcept { return std::holds_alternative<RectArea>(m_shape); }
    [[nodiscard]] bool IsCircle() const noexcept { return std::holds_alternative<CircleArea>(m_shape); }

    [[nodiscard]] std::string ToString() const;

    bool operator==(const MapRegion&) const = default;

private:
    Shape m_shape;
};

} // namespace Hillkeeper
