#pragma once

#include <glm/vec3.hpp>

namespace engine::physics
{
/// Line-of-sight primitive consumed by perception code.
/// Implementations report whether static geometry interrupts the segment
/// between two points; the segment end owners never count as blockers.
class SightBlocker
{
public:
    virtual ~SightBlocker() = default;

    [[nodiscard]] virtual bool RaycastBlocked(const glm::vec3& from, const glm::vec3& to) const = 0;
};
} // namespace engine::physics
