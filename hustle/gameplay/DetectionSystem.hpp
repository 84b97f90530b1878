#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

#include "hustle/gameplay/TuningConfig.hpp"

namespace engine::core
{
class EventBus;
}

namespace engine::physics
{
class SightBlocker;
}

namespace hustle::gameplay
{
enum class ObserverRole : std::uint8_t
{
    Boss,
    Cop,
    Coworker,
    Security,
    Civilian
};

/// Pipeline stage a detection query stopped at, in evaluation order.
/// For a miss the deepest stage reached by any co-located observer is reported.
enum class DetectionStage : std::uint8_t
{
    NoObserver = 0, ///< Nobody shares the actor's location
    OutOfRange,
    Blocked,
    OutsideCone,
    NotInterested, ///< Observer does not care about this kind of activity
    Undetectable,  ///< Visual profile is zero
    BelowThreshold,
    Detected
};

/// Global perception dials.
/// Owned by whoever builds the systems; DetectionSystem is the only writer.
struct DetectionDials
{
    float patrolFrequency = 1.0F;
    float detectionSensitivity = 1.0F;
};

struct ObserverData
{
    ObserverRole role = ObserverRole::Civilian;
    glm::vec3 position{0.0F};
    glm::vec3 facing{0.0F, 0.0F, 1.0F};
    float visionRange = 10.0F;
    float visionConeDegrees = 90.0F;
    float audioSensitivity = 0.5F;
    bool caresAboutLegality = false;
    bool caresAboutJobPerformance = false;
    std::string currentLocation;
};

struct Observer
{
    std::string id;
    ObserverData data;
    std::vector<glm::vec3> patrolWaypoints;
    std::size_t currentWaypointIndex = 0;
    double nextPatrolTime = 0.0;
    float patrolIntervalSeconds = 0.0F;

    [[nodiscard]] bool IsPatrolling() const { return !patrolWaypoints.empty(); }
};

struct ActorPose
{
    glm::vec3 position{0.0F};
    std::string locationId;
};

struct DetectionResult
{
    bool detected = false;
    std::optional<std::string> observerId;
    float severity = 0.0F;
    std::string riskTag;
    DetectionStage reason = DetectionStage::NoObserver;
};

/// Observer registry and sensor model.
/// Answers whether an actor doing something is seen, and how risky a spot is.
/// Detection is stateless; only patrol stepping mutates observers over time.
class DetectionSystem
{
public:
    DetectionSystem(
        DetectionDials& dials,
        DetectionTuning tuning = {},
        engine::core::EventBus* eventBus = nullptr,
        const engine::physics::SightBlocker* sightBlocker = nullptr
    );

    void SetSightBlocker(const engine::physics::SightBlocker* sightBlocker) { m_sightBlocker = sightBlocker; }

    // Observer registry
    void RegisterObserver(const std::string& observerId, const ObserverData& data);
    void UnregisterObserver(const std::string& observerId);
    void UpdateObserverPose(const std::string& observerId, const glm::vec3& position, const glm::vec3& facing);
    void SetObserverLocation(const std::string& observerId, const std::string& locationId);
    void SetPatrolPattern(const std::string& observerId, const std::vector<glm::vec3>& waypoints, float intervalSeconds);

    [[nodiscard]] const Observer* GetObserver(const std::string& observerId) const;
    [[nodiscard]] std::vector<std::string> ListObservers() const;
    [[nodiscard]] std::size_t ObserverCount() const { return m_observers.size(); }

    // Actors and activity profiles
    void SetActorPose(const std::string& actorId, const glm::vec3& position, const std::string& locationId);
    [[nodiscard]] ActorPose GetActorPose(const std::string& actorId) const;
    void RegisterActivityProfile(const std::string& riskTag, const ActivityProfile& profile);
    [[nodiscard]] ActivityProfile GetActivityProfile(const std::string& riskTag) const;

    // Queries
    [[nodiscard]] DetectionResult CheckDetection(const std::string& actorId, const std::string& riskTag);
    [[nodiscard]] float GetDetectionRisk(const std::string& actorId, const std::string& riskTag, const std::string& locationId);
    [[nodiscard]] static float CalculateSeverity(const ActivityProfile& activity, const ObserverData& observer);

    // Global dials (multiplicative: repeated calls compound)
    void SetPatrolFrequency(float multiplier);
    void SetDetectionSensitivity(float multiplier);
    void ResetDials();
    [[nodiscard]] float GetPatrolFrequency() const { return m_dials.patrolFrequency; }
    [[nodiscard]] float GetDetectionSensitivity() const { return m_dials.detectionSensitivity; }

    /// Steps patrol routes.
    void Update(float deltaSeconds);
    [[nodiscard]] double ElapsedSeconds() const { return m_elapsedSeconds; }

    // Deterministic hooks for tests and replays
    void SetPatrolJitterOverride(std::optional<float> jitterSeconds) { m_jitterOverride = jitterSeconds; }
    void Reseed(std::uint32_t seed) { m_rng.seed(seed); }

private:
    DetectionStage EvaluateObserver(
        const Observer& observer,
        const ActorPose& actor,
        const ActivityProfile& activity
    ) const;
    [[nodiscard]] static bool CaresAbout(const ObserverData& observer, const ActivityProfile& activity);
    void StepPatrol(Observer& observer);
    void Publish(const std::string& name, std::vector<std::string> args, float value);
    ObserverData Sanitize(ObserverData data) const;

    DetectionDials& m_dials;
    DetectionTuning m_tuning;
    engine::core::EventBus* m_eventBus = nullptr;
    const engine::physics::SightBlocker* m_sightBlocker = nullptr;

    // Ordered by id so query results never depend on registration order.
    std::map<std::string, Observer> m_observers;
    std::unordered_map<std::string, ActorPose> m_actors;
    std::unordered_map<std::string, ActivityProfile> m_profiles;

    double m_elapsedSeconds = 0.0;
    std::mt19937 m_rng;
    std::optional<float> m_jitterOverride;
};

[[nodiscard]] const char* ObserverRoleToText(ObserverRole role);
[[nodiscard]] const char* DetectionStageToText(DetectionStage stage);
} // namespace hustle::gameplay
