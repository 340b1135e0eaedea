#include "spatial/MapRegion.hpp"
#include <spdlog/fmt/fmt.h>

namespace Hillkeeper {

namespace {

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

bool RectContainsPoint(const RectArea& rect, float x, float z) {
    return x >= rect.left && x <= rect.right && z >= rect.bottom && z <= rect.top;
}

bool CircleContainsPoint(const CircleArea& circle, float x, float z) {
    const float dx = x - circle.center.x;
    const float dz = z - circle.center.y;
    return dx * dx + dz * dz <= circle.radius * circle.radius;
}

} // namespace

bool MapRegion::ContainsPoint(float x, float z) const {
    return std::visit(Overloaded{
        [x, z](const RectArea& rect) { return RectContainsPoint(rect, x, z); },
        [x, z](const CircleArea& circle) { return CircleContainsPoint(circle, x, z); }
    }, m_shape);
}

bool MapRegion::ContainsFootprint(float x, float z, float sizeX, float sizeZ) const {
    const float top = z + sizeZ / 2.0f;
    const float right = x + sizeX / 2.0f;
    const float bottom = z - sizeZ / 2.0f;
    const float left = x - sizeX / 2.0f;

    return std::visit(Overloaded{
        [&](const RectArea& rect) {
            return top <= rect.top && right <= rect.right &&
                   bottom >= rect.bottom && left >= rect.left;
        },
        [&](const CircleArea& circle) {
            return CircleContainsPoint(circle, left, top) &&
                   CircleContainsPoint(circle, right, top) &&
                   CircleContainsPoint(circle, right, bottom) &&
                   CircleContainsPoint(circle, left, bottom);
        }
    }, m_shape);
}

std::string MapRegion::ToString() const {
    return std::visit(Overloaded{
        [](const RectArea& rect) {
            return fmt::format("rect(left={}, top={}, right={}, bottom={})",
                               rect.left, rect.top, rect.right, rect.bottom);
        },
        [](const CircleArea& circle) {
            return fmt::format("circle(x={}, z={}, radius={})",
                               circle.center.x, circle.center.y, circle.radius);
        }
    }, m_shape);
}

} // namespace Hillkeeper
