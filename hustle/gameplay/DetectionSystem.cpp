#include "hustle/gameplay/DetectionSystem.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

#include "engine/core/EventBus.hpp"
#include "engine/physics/SightBlocker.hpp"

namespace hustle::gameplay
{
namespace
{
constexpr float kDirectionEpsilon = 1.0e-5F;
constexpr float kBaseSeverity = 0.5F;
constexpr float kIllegalSeverityBonus = 0.3F;
constexpr float kLawEnforcementBonus = 0.2F;
constexpr float kAuthorityBonus = 0.2F;
}

DetectionSystem::DetectionSystem(
    DetectionDials& dials,
    DetectionTuning tuning,
    engine::core::EventBus* eventBus,
    const engine::physics::SightBlocker* sightBlocker
)
    : m_dials(dials)
    , m_tuning(std::move(tuning))
    , m_eventBus(eventBus)
    , m_sightBlocker(sightBlocker)
    , m_rng(m_tuning.randomSeed)
{
}

ObserverData DetectionSystem::Sanitize(ObserverData data) const
{
    data.visionRange = std::max(m_tuning.minVisionRange, data.visionRange);
    data.visionConeDegrees = std::clamp(data.visionConeDegrees, kDirectionEpsilon, 360.0F);
    data.audioSensitivity = std::clamp(data.audioSensitivity, 0.0F, 1.0F);
    if (glm::length(data.facing) < kDirectionEpsilon)
    {
        data.facing = glm::vec3{0.0F, 0.0F, 1.0F};
    }
    data.facing = glm::normalize(data.facing);
    return data;
}

void DetectionSystem::RegisterObserver(const std::string& observerId, const ObserverData& data)
{
    if (observerId.empty())
    {
        std::cout << "[Detection] WARNING - RegisterObserver called with empty id\n";
        return;
    }

    if (m_observers.contains(observerId) && m_tuning.verboseLogging)
    {
        std::cout << "[Detection] Observer '" << observerId << "' re-registered, overwriting\n";
    }

    Observer observer;
    observer.id = observerId;
    observer.data = Sanitize(data);
    m_observers[observerId] = std::move(observer);
}

void DetectionSystem::UnregisterObserver(const std::string& observerId)
{
    if (m_observers.erase(observerId) == 0 && m_tuning.verboseLogging)
    {
        std::cout << "[Detection] Unregister ignored, observer '" << observerId << "' not found\n";
    }
}

void DetectionSystem::UpdateObserverPose(const std::string& observerId, const glm::vec3& position, const glm::vec3& facing)
{
    const auto it = m_observers.find(observerId);
    if (it == m_observers.end())
    {
        std::cout << "[Detection] WARNING - UpdateObserverPose: observer '" << observerId << "' not found\n";
        return;
    }

    it->second.data.position = position;
    if (glm::length(facing) >= kDirectionEpsilon)
    {
        it->second.data.facing = glm::normalize(facing);
    }
}

void DetectionSystem::SetObserverLocation(const std::string& observerId, const std::string& locationId)
{
    const auto it = m_observers.find(observerId);
    if (it == m_observers.end())
    {
        std::cout << "[Detection] WARNING - SetObserverLocation: observer '" << observerId << "' not found\n";
        return;
    }
    it->second.data.currentLocation = locationId;
}

void DetectionSystem::SetPatrolPattern(const std::string& observerId, const std::vector<glm::vec3>& waypoints, float intervalSeconds)
{
    const auto it = m_observers.find(observerId);
    if (it == m_observers.end())
    {
        std::cout << "[Detection] WARNING - SetPatrolPattern: observer '" << observerId << "' not found\n";
        return;
    }

    Observer& observer = it->second;
    observer.patrolWaypoints = waypoints;
    observer.currentWaypointIndex = 0;
    observer.patrolIntervalSeconds = intervalSeconds > 0.0F ? intervalSeconds : m_tuning.defaultPatrolIntervalSeconds;
    observer.nextPatrolTime = m_elapsedSeconds + observer.patrolIntervalSeconds;
}

const Observer* DetectionSystem::GetObserver(const std::string& observerId) const
{
    const auto it = m_observers.find(observerId);
    return it != m_observers.end() ? &it->second : nullptr;
}

std::vector<std::string> DetectionSystem::ListObservers() const
{
    std::vector<std::string> ids;
    ids.reserve(m_observers.size());
    for (const auto& [id, observer] : m_observers)
    {
        ids.push_back(id);
    }
    return ids;
}

void DetectionSystem::SetActorPose(const std::string& actorId, const glm::vec3& position, const std::string& locationId)
{
    m_actors[actorId] = ActorPose{position, locationId};
}

ActorPose DetectionSystem::GetActorPose(const std::string& actorId) const
{
    const auto it = m_actors.find(actorId);
    if (it != m_actors.end())
    {
        return it->second;
    }
    return ActorPose{glm::vec3{0.0F}, m_tuning.defaultLocation};
}

void DetectionSystem::RegisterActivityProfile(const std::string& riskTag, const ActivityProfile& profile)
{
    ActivityProfile clamped = profile;
    clamped.visualProfile = std::max(0.0F, clamped.visualProfile);
    m_profiles[riskTag] = clamped;
}

ActivityProfile DetectionSystem::GetActivityProfile(const std::string& riskTag) const
{
    if (const auto it = m_profiles.find(riskTag); it != m_profiles.end())
    {
        return it->second;
    }
    if (const auto it = m_tuning.activityProfiles.find(riskTag); it != m_tuning.activityProfiles.end())
    {
        return it->second;
    }
    return m_tuning.defaultProfile;
}

bool DetectionSystem::CaresAbout(const ObserverData& observer, const ActivityProfile& activity)
{
    return activity.isLegal ? observer.caresAboutJobPerformance : observer.caresAboutLegality;
}

DetectionStage DetectionSystem::EvaluateObserver(
    const Observer& observer,
    const ActorPose& actor,
    const ActivityProfile& activity
) const
{
    const ObserverData& data = observer.data;
    const glm::vec3 toActor = actor.position - data.position;
    const float distance = glm::length(toActor);

    if (distance > data.visionRange)
    {
        return DetectionStage::OutOfRange;
    }

    if (m_sightBlocker != nullptr && m_sightBlocker->RaycastBlocked(data.position, actor.position))
    {
        return DetectionStage::Blocked;
    }

    // An actor standing on the observer is inside any cone.
    if (distance > kDirectionEpsilon)
    {
        const float cosAngle = std::clamp(glm::dot(data.facing, toActor / distance), -1.0F, 1.0F);
        const float angleDegrees = glm::degrees(std::acos(cosAngle));
        if (angleDegrees > data.visionConeDegrees * 0.5F)
        {
            return DetectionStage::OutsideCone;
        }
    }

    if (!CaresAbout(data, activity))
    {
        return DetectionStage::NotInterested;
    }

    if (activity.visualProfile <= 0.0F)
    {
        return DetectionStage::Undetectable;
    }

    const float awareness = data.visionRange / std::max(distance, m_tuning.distanceEpsilon);
    if (awareness * m_dials.detectionSensitivity < activity.visualProfile)
    {
        return DetectionStage::BelowThreshold;
    }

    return DetectionStage::Detected;
}

DetectionResult DetectionSystem::CheckDetection(const std::string& actorId, const std::string& riskTag)
{
    const ActorPose actor = GetActorPose(actorId);
    const ActivityProfile activity = GetActivityProfile(riskTag);

    DetectionResult result;
    result.riskTag = riskTag;

    for (const auto& [id, observer] : m_observers)
    {
        if (observer.data.currentLocation != actor.locationId)
        {
            continue;
        }

        const DetectionStage stage = EvaluateObserver(observer, actor, activity);
        if (stage != DetectionStage::Detected)
        {
            result.reason = std::max(result.reason, stage);
            continue;
        }

        result.detected = true;
        result.observerId = id;
        result.severity = CalculateSeverity(activity, observer.data);
        result.reason = DetectionStage::Detected;

        if (m_tuning.verboseLogging)
        {
            std::cout << "[Detection] '" << actorId << "' seen by '" << id << "' doing '" << riskTag
                      << "' (severity " << result.severity << ")\n";
        }
        Publish("player_detected", {actorId, id, riskTag}, result.severity);
        return result;
    }

    return result;
}

float DetectionSystem::GetDetectionRisk(const std::string& actorId, const std::string& riskTag, const std::string& locationId)
{
    const ActorPose actor = GetActorPose(actorId);
    const ActivityProfile activity = GetActivityProfile(riskTag);
    float maxRisk = 0.0F;

    for (const auto& [id, observer] : m_observers)
    {
        const ObserverData& data = observer.data;
        if (data.currentLocation != locationId || !CaresAbout(data, activity))
        {
            continue;
        }

        const float distance = glm::distance(data.position, actor.position);
        if (distance > data.visionRange)
        {
            continue;
        }

        const float proximity = 1.0F - (distance / data.visionRange);
        maxRisk = std::max(maxRisk, proximity * activity.visualProfile * m_dials.detectionSensitivity);
    }

    const float risk = std::clamp(maxRisk, 0.0F, 1.0F);
    Publish("detection_risk", {actorId, riskTag, locationId}, risk);
    return risk;
}

float DetectionSystem::CalculateSeverity(const ActivityProfile& activity, const ObserverData& observer)
{
    float severity = kBaseSeverity;
    if (!activity.isLegal)
    {
        severity += kIllegalSeverityBonus;
        if (observer.role == ObserverRole::Cop)
        {
            severity += kLawEnforcementBonus;
        }
    }
    if (observer.role == ObserverRole::Boss && observer.caresAboutJobPerformance)
    {
        severity += kAuthorityBonus;
    }
    return std::clamp(severity, 0.0F, 1.0F);
}

void DetectionSystem::SetPatrolFrequency(float multiplier)
{
    m_dials.patrolFrequency = std::max(m_tuning.minDialMultiplier, m_dials.patrolFrequency * multiplier);
    if (m_tuning.verboseLogging)
    {
        std::cout << "[Detection] Patrol frequency x" << multiplier << " -> " << m_dials.patrolFrequency << "\n";
    }
}

void DetectionSystem::SetDetectionSensitivity(float multiplier)
{
    m_dials.detectionSensitivity = std::max(m_tuning.minDialMultiplier, m_dials.detectionSensitivity * multiplier);
    if (m_tuning.verboseLogging)
    {
        std::cout << "[Detection] Sensitivity x" << multiplier << " -> " << m_dials.detectionSensitivity << "\n";
    }
}

void DetectionSystem::ResetDials()
{
    m_dials = DetectionDials{};
}

void DetectionSystem::Update(float deltaSeconds)
{
    if (deltaSeconds <= 0.0F)
    {
        return;
    }

    m_elapsedSeconds += deltaSeconds;
    for (auto& [id, observer] : m_observers)
    {
        if (observer.IsPatrolling() && m_elapsedSeconds >= observer.nextPatrolTime)
        {
            StepPatrol(observer);
        }
    }
}

void DetectionSystem::StepPatrol(Observer& observer)
{
    observer.currentWaypointIndex = (observer.currentWaypointIndex + 1) % observer.patrolWaypoints.size();
    const glm::vec3 nextWaypoint = observer.patrolWaypoints[observer.currentWaypointIndex];
    const glm::vec3 direction = nextWaypoint - observer.data.position;
    observer.data.position = nextWaypoint;
    if (glm::length(direction) >= kDirectionEpsilon)
    {
        observer.data.facing = glm::normalize(direction);
    }

    const float interval = observer.patrolIntervalSeconds / m_dials.patrolFrequency;
    float jitter = 0.0F;
    if (m_jitterOverride.has_value())
    {
        jitter = *m_jitterOverride;
    }
    else
    {
        const float variance = interval * m_tuning.patrolJitterFraction;
        if (variance > 0.0F)
        {
            std::uniform_real_distribution<float> dist(-variance, variance);
            jitter = dist(m_rng);
        }
    }

    observer.nextPatrolTime = m_elapsedSeconds + std::max(0.0F, interval + jitter);
}

void DetectionSystem::Publish(const std::string& name, std::vector<std::string> args, float value)
{
    if (m_eventBus == nullptr)
    {
        return;
    }
    m_eventBus->Publish(engine::core::Event{name, std::move(args), value});
}

const char* ObserverRoleToText(ObserverRole role)
{
    switch (role)
    {
        case ObserverRole::Boss: return "boss";
        case ObserverRole::Cop: return "cop";
        case ObserverRole::Coworker: return "coworker";
        case ObserverRole::Security: return "security";
        case ObserverRole::Civilian: return "civilian";
        default: return "unknown";
    }
}

const char* DetectionStageToText(DetectionStage stage)
{
    switch (stage)
    {
        case DetectionStage::NoObserver: return "no_observer";
        case DetectionStage::OutOfRange: return "out_of_range";
        case DetectionStage::Blocked: return "blocked";
        case DetectionStage::OutsideCone: return "outside_cone";
        case DetectionStage::NotInterested: return "not_interested";
        case DetectionStage::Undetectable: return "undetectable";
        case DetectionStage::BelowThreshold: return "below_threshold";
        case DetectionStage::Detected: return "detected";
        default: return "unknown";
    }
}
} // namespace hustle::gameplay
