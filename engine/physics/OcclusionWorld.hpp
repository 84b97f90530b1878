#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

#include "engine/physics/SightBlocker.hpp"

namespace engine::physics
{
enum class OccluderLayer
{
    Actor,
    Environment,
    Prop
};

struct OccluderBox
{
    std::string id;
    glm::vec3 center{0.0F};
    glm::vec3 halfExtents{0.5F};
    OccluderLayer layer = OccluderLayer::Environment;
    bool blocksSight = true;
};

/// Static box geometry answering sight queries.
/// Boxes in the Actor layer are the observed bodies themselves and are skipped
/// by RaycastBlocked, so an actor never hides itself.
class OcclusionWorld final : public SightBlocker
{
public:
    void Clear();

    void AddBox(const OccluderBox& box);
    bool RemoveBox(const std::string& id);
    /// Moves an existing box. Returns true if found.
    bool MoveBox(const std::string& id, const glm::vec3& newCenter);

    [[nodiscard]] const std::vector<OccluderBox>& Boxes() const { return m_boxes; }

    [[nodiscard]] bool RaycastBlocked(const glm::vec3& from, const glm::vec3& to) const override;

    static bool SegmentIntersectsAabb(
        const glm::vec3& from,
        const glm::vec3& to,
        const glm::vec3& minBounds,
        const glm::vec3& maxBounds,
        float* outT
    );

private:
    struct CellKey
    {
        int x = 0;
        int y = 0;
        int z = 0;

        [[nodiscard]] bool operator==(const CellKey& other) const
        {
            return x == other.x && y == other.y && z == other.z;
        }
    };

    struct CellKeyHash
    {
        [[nodiscard]] std::size_t operator()(const CellKey& key) const
        {
            const std::size_t hx = static_cast<std::size_t>(key.x) * 73856093U;
            const std::size_t hy = static_cast<std::size_t>(key.y) * 19349663U;
            const std::size_t hz = static_cast<std::size_t>(key.z) * 83492791U;
            return hx ^ hy ^ hz;
        }
    };

    void RebuildIndex() const;
    void GatherCandidates(const glm::vec3& minBounds, const glm::vec3& maxBounds) const;

    std::vector<OccluderBox> m_boxes;

    mutable std::unordered_map<CellKey, std::vector<std::size_t>, CellKeyHash> m_cells;
    mutable std::vector<std::size_t> m_candidates;
    mutable std::vector<std::uint32_t> m_visitStamp;
    mutable std::uint32_t m_currentStamp = 1;
    mutable bool m_indexDirty = true;
    float m_cellSize = 8.0F;
};
} // namespace engine::physics
