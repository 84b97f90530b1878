#include "engine/physics/OcclusionWorld.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <glm/common.hpp>

namespace engine::physics
{
namespace
{
constexpr float kParallelEpsilon = 1.0e-7F;

int CellCoord(float value, float cellSize)
{
    return static_cast<int>(std::floor(value / std::max(0.001F, cellSize)));
}
} // namespace

void OcclusionWorld::Clear()
{
    m_boxes.clear();
    m_cells.clear();
    m_candidates.clear();
    m_visitStamp.clear();
    m_currentStamp = 1;
    m_indexDirty = true;
}

void OcclusionWorld::AddBox(const OccluderBox& box)
{
    m_boxes.push_back(box);
    m_indexDirty = true;
}

bool OcclusionWorld::RemoveBox(const std::string& id)
{
    const auto it = std::find_if(m_boxes.begin(), m_boxes.end(), [&](const OccluderBox& box) {
        return box.id == id;
    });
    if (it == m_boxes.end())
    {
        return false;
    }
    m_boxes.erase(it);
    m_indexDirty = true;
    return true;
}

bool OcclusionWorld::MoveBox(const std::string& id, const glm::vec3& newCenter)
{
    for (OccluderBox& box : m_boxes)
    {
        if (box.id == id)
        {
            box.center = newCenter;
            m_indexDirty = true;
            return true;
        }
    }
    return false;
}

bool OcclusionWorld::RaycastBlocked(const glm::vec3& from, const glm::vec3& to) const
{
    GatherCandidates(glm::min(from, to), glm::max(from, to));

    for (const std::size_t index : m_candidates)
    {
        const OccluderBox& box = m_boxes[index];
        if (!box.blocksSight || box.layer == OccluderLayer::Actor)
        {
            continue;
        }

        if (SegmentIntersectsAabb(from, to, box.center - box.halfExtents, box.center + box.halfExtents, nullptr))
        {
            return true;
        }
    }

    return false;
}

bool OcclusionWorld::SegmentIntersectsAabb(
    const glm::vec3& from,
    const glm::vec3& to,
    const glm::vec3& minBounds,
    const glm::vec3& maxBounds,
    float* outT
)
{
    const glm::vec3 direction = to - from;
    float tMin = 0.0F;
    float tMax = 1.0F;

    for (int axis = 0; axis < 3; ++axis)
    {
        const float start = from[axis];
        const float dir = direction[axis];

        if (std::abs(dir) < kParallelEpsilon)
        {
            if (start < minBounds[axis] || start > maxBounds[axis])
            {
                return false;
            }
            continue;
        }

        const float invDir = 1.0F / dir;
        float t1 = (minBounds[axis] - start) * invDir;
        float t2 = (maxBounds[axis] - start) * invDir;
        if (t1 > t2)
        {
            std::swap(t1, t2);
        }

        tMin = std::max(tMin, t1);
        tMax = std::min(tMax, t2);
        if (tMin > tMax)
        {
            return false;
        }
    }

    if (outT != nullptr)
    {
        *outT = tMin;
    }
    return true;
}

void OcclusionWorld::RebuildIndex() const
{
    if (!m_indexDirty)
    {
        return;
    }

    m_cells.clear();
    m_visitStamp.assign(m_boxes.size(), 0U);
    m_currentStamp = 1;

    for (std::size_t index = 0; index < m_boxes.size(); ++index)
    {
        const OccluderBox& box = m_boxes[index];
        const glm::vec3 minBounds = box.center - box.halfExtents;
        const glm::vec3 maxBounds = box.center + box.halfExtents;

        for (int z = CellCoord(minBounds.z, m_cellSize); z <= CellCoord(maxBounds.z, m_cellSize); ++z)
        {
            for (int y = CellCoord(minBounds.y, m_cellSize); y <= CellCoord(maxBounds.y, m_cellSize); ++y)
            {
                for (int x = CellCoord(minBounds.x, m_cellSize); x <= CellCoord(maxBounds.x, m_cellSize); ++x)
                {
                    m_cells[CellKey{x, y, z}].push_back(index);
                }
            }
        }
    }

    m_indexDirty = false;
}

void OcclusionWorld::GatherCandidates(const glm::vec3& minBounds, const glm::vec3& maxBounds) const
{
    RebuildIndex();
    m_candidates.clear();
    if (m_boxes.empty())
    {
        return;
    }

    ++m_currentStamp;
    if (m_currentStamp == 0)
    {
        std::fill(m_visitStamp.begin(), m_visitStamp.end(), 0U);
        m_currentStamp = 1;
    }

    for (int z = CellCoord(minBounds.z, m_cellSize); z <= CellCoord(maxBounds.z, m_cellSize); ++z)
    {
        for (int y = CellCoord(minBounds.y, m_cellSize); y <= CellCoord(maxBounds.y, m_cellSize); ++y)
        {
            for (int x = CellCoord(minBounds.x, m_cellSize); x <= CellCoord(maxBounds.x, m_cellSize); ++x)
            {
                const auto it = m_cells.find(CellKey{x, y, z});
                if (it == m_cells.end())
                {
                    continue;
                }
                for (const std::size_t index : it->second)
                {
                    if (m_visitStamp[index] == m_currentStamp)
                    {
                        continue;
                    }
                    m_visitStamp[index] = m_currentStamp;
                    m_candidates.push_back(index);
                }
            }
        }
    }

    // Cell order depends on the hash map; keep results stable.
    std::sort(m_candidates.begin(), m_candidates.end());
}
} // namespace engine::physics
