#include "hustle/gameplay/ActivitySystem.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "engine/core/EventBus.hpp"
#include "hustle/gameplay/DetectionSystem.hpp"

namespace hustle::gameplay
{
namespace
{
constexpr float kMaxPerformance = 100.0F;
constexpr float kMaxCombinedAttention = 1.0F;
}

ActivitySystem::ActivitySystem(ActivityTuning tuning, DetectionSystem* detection, engine::core::EventBus* eventBus)
    : m_tuning(std::move(tuning))
    , m_detection(detection)
    , m_eventBus(eventBus)
{
}

std::string ActivitySystem::Create(ActivityKind kind, const std::string& riskTag, float durationSeconds)
{
    ActivitySpec spec;
    spec.kind = kind;
    spec.riskTag = riskTag;
    spec.durationSeconds = durationSeconds;
    return Create(spec);
}

std::string ActivitySystem::Create(const ActivitySpec& spec)
{
    Activity activity;
    activity.creationOrder = m_nextSerial++;
    activity.id = "activity_" + std::to_string(activity.creationOrder);
    activity.ownerId = spec.ownerId.empty() ? m_tuning.defaultOwnerId : spec.ownerId;
    activity.kind = spec.kind;
    activity.riskTag = spec.riskTag;
    activity.multitaskingLevel = spec.multitaskingLevel;
    activity.requiredAttention = std::clamp(spec.requiredAttention.value_or(AttentionFor(spec.riskTag)), 0.0F, 1.0F);
    // Non-positive durations finish on the first update.
    activity.durationSeconds = std::max(0.0F, spec.durationSeconds);
    activity.performanceScore = m_tuning.initialPerformance;

    for (const std::string& existingId : m_creationOrder)
    {
        Activity& existing = m_activities.at(existingId);
        if (existing.ownerId != activity.ownerId || !existing.IsLive())
        {
            continue;
        }

        Publish("activity_multitask_attempt", {activity.id, existing.id});
        if (!AreCompatible(activity, existing))
        {
            SetState(existing, ActivityState::Paused, "activity_paused");
            if (m_tuning.verboseLogging)
            {
                std::cout << "[Activity] '" << existing.id << "' paused, cannot run alongside '" << activity.riskTag << "'\n";
            }
        }
        else
        {
            activity.concurrentWith.insert(existing.id);
            existing.concurrentWith.insert(activity.id);
        }
    }

    const std::string id = activity.id;
    m_creationOrder.push_back(id);
    m_activities.emplace(id, std::move(activity));

    Publish("activity_started", {id, m_activities.at(id).ownerId, spec.riskTag});
    return id;
}

void ActivitySystem::Pause(const std::string& activityId)
{
    Activity* activity = FindActivity(activityId);
    if (activity == nullptr || !activity->IsLive())
    {
        return;
    }
    SetState(*activity, ActivityState::Paused, "activity_paused");
}

void ActivitySystem::Resume(const std::string& activityId)
{
    Activity* activity = FindActivity(activityId);
    if (activity == nullptr || activity->state != ActivityState::Paused)
    {
        return;
    }

    // The newer of two incompatible activities wins, so a resume never displaces a later start.
    std::vector<Activity*> displaced;
    for (const std::string& otherId : m_creationOrder)
    {
        Activity& other = m_activities.at(otherId);
        if (other.id == activity->id || other.ownerId != activity->ownerId || !other.IsLive())
        {
            continue;
        }
        if (AreCompatible(*activity, other))
        {
            continue;
        }
        if (other.creationOrder > activity->creationOrder)
        {
            std::cout << "[Activity] WARNING - Resume of '" << activityId << "' declined, conflicts with newer '" << other.id << "'\n";
            return;
        }
        displaced.push_back(&other);
    }

    for (Activity* other : displaced)
    {
        SetState(*other, ActivityState::Paused, "activity_paused");
    }
    SetState(*activity, ActivityState::Running, "activity_resumed");
}

ActivityResult ActivitySystem::End(const std::string& activityId)
{
    return Finish(activityId, ActivityState::Completed);
}

ActivityResult ActivitySystem::Fail(const std::string& activityId)
{
    return Finish(activityId, ActivityState::Failed);
}

ActivityResult ActivitySystem::Finish(const std::string& activityId, ActivityState terminalState)
{
    const auto it = m_activities.find(activityId);
    if (it == m_activities.end())
    {
        ActivityResult empty;
        empty.activityId = activityId;
        return empty;
    }

    Activity& activity = it->second;
    activity.state = terminalState;

    ActivityResult result;
    result.activityId = activity.id;
    result.ownerId = activity.ownerId;
    result.riskTag = activity.riskTag;
    result.performanceScore = activity.performanceScore;
    result.elapsedSeconds = activity.elapsedSeconds;
    result.completed = terminalState == ActivityState::Completed;
    result.wasDetected = activity.wasDetected;

    for (const std::string& otherId : activity.concurrentWith)
    {
        if (Activity* other = FindActivity(otherId))
        {
            other->concurrentWith.erase(activity.id);
        }
    }

    m_activities.erase(it);
    m_creationOrder.erase(std::remove(m_creationOrder.begin(), m_creationOrder.end(), activityId), m_creationOrder.end());
    m_performanceSamples.erase(activityId);
    m_forcedDetections.erase(activityId);

    Publish(
        "activity_ended",
        {result.activityId, result.ownerId, result.completed ? "completed" : "failed"},
        result.performanceScore
    );
    return result;
}

void ActivitySystem::Update(float deltaSeconds)
{
    if (deltaSeconds <= 0.0F)
    {
        return;
    }

    // Finishing removes entries, so walk a snapshot.
    const std::vector<std::string> order = m_creationOrder;
    for (const std::string& id : order)
    {
        Activity* activity = FindActivity(id);
        if (activity == nullptr || !activity->IsLive())
        {
            continue;
        }

        activity->elapsedSeconds += deltaSeconds;
        if (activity->durationSeconds <= 0.0F || activity->elapsedSeconds >= activity->durationSeconds)
        {
            m_finished.push_back(Finish(id, ActivityState::Completed));
            if (m_finished.size() > m_tuning.maxFinishedResults)
            {
                std::cout << "[Activity] WARNING - Finished results not drained, dropping '" << m_finished.front().activityId << "'\n";
                m_finished.erase(m_finished.begin());
            }
            continue;
        }

        const auto sampleIt = m_performanceSamples.find(id);
        const float sample = sampleIt != m_performanceSamples.end() ? sampleIt->second : m_tuning.defaultPerformanceSample;
        const float weight = m_tuning.performanceBlendWeight;
        activity->performanceScore = activity->performanceScore * (1.0F - weight) + sample * weight;

        if (!activity->wasDetected && IsRiskBearing(activity->riskTag))
        {
            RunDetection(*activity);
        }

        if (!activity->phases.empty())
        {
            AdvancePhases(*activity);
        }
    }
}

void ActivitySystem::RunDetection(Activity& activity)
{
    DetectionResult detection;
    if (m_forcedDetections.contains(activity.id))
    {
        detection.detected = true;
        detection.severity = 0.5F;
        detection.riskTag = activity.riskTag;
    }
    else if (m_detection != nullptr)
    {
        detection = m_detection->CheckDetection(activity.ownerId, activity.riskTag);
    }

    if (!detection.detected)
    {
        return;
    }

    activity.wasDetected = true;
    activity.performanceScore = std::max(0.0F, activity.performanceScore - m_tuning.detectionPenalty);

    std::cout << "[Activity] '" << activity.id << "' (" << activity.riskTag << ") caught by '"
              << detection.observerId.value_or("unknown") << "'\n";
    Publish(
        "activity_caught",
        {activity.id, activity.ownerId, activity.riskTag, detection.observerId.value_or("")},
        detection.severity
    );
}

void ActivitySystem::AdvancePhases(Activity& activity)
{
    // Bounded so zero-length phases cannot spin forever.
    for (std::size_t guard = 0; guard < activity.phases.size(); ++guard)
    {
        const ActivityPhase& phase = activity.phases[activity.currentPhaseIndex];
        if (activity.elapsedSeconds - activity.phaseStartSeconds < phase.durationSeconds)
        {
            return;
        }

        activity.phaseStartSeconds += phase.durationSeconds;
        activity.currentPhaseIndex = (activity.currentPhaseIndex + 1) % activity.phases.size();
        ApplyPhase(activity);
        Publish(
            "activity_phase_changed",
            {activity.id, activity.phases[activity.currentPhaseIndex].name},
            static_cast<float>(activity.currentPhaseIndex)
        );
    }
}

void ActivitySystem::ApplyPhase(Activity& activity)
{
    const ActivityPhase& phase = activity.phases[activity.currentPhaseIndex];
    activity.multitaskingLevel = phase.multitaskingAllowed ? MultitaskingLevel::Breaks : MultitaskingLevel::None;
    activity.requiredAttention = std::clamp(phase.attention, 0.0F, 1.0F);
}

bool ActivitySystem::CanMultitask(const std::string& firstId, const std::string& secondId) const
{
    const Activity* first = GetActivity(firstId);
    const Activity* second = GetActivity(secondId);
    if (first == nullptr || second == nullptr)
    {
        return false;
    }
    return AreCompatible(*first, *second);
}

bool ActivitySystem::AreCompatible(const Activity& first, const Activity& second)
{
    if (first.kind == second.kind && first.kind != ActivityKind::Passive)
    {
        return false;
    }
    if (first.requiredAttention + second.requiredAttention > kMaxCombinedAttention)
    {
        return false;
    }
    return first.multitaskingLevel != MultitaskingLevel::None && second.multitaskingLevel != MultitaskingLevel::None;
}

const Activity* ActivitySystem::GetActivity(const std::string& activityId) const
{
    const auto it = m_activities.find(activityId);
    return it != m_activities.end() ? &it->second : nullptr;
}

Activity* ActivitySystem::FindActivity(const std::string& activityId)
{
    const auto it = m_activities.find(activityId);
    return it != m_activities.end() ? &it->second : nullptr;
}

std::vector<const Activity*> ActivitySystem::GetActiveActivities(const std::string& ownerId) const
{
    std::vector<const Activity*> result;
    for (const std::string& id : m_creationOrder)
    {
        const Activity& activity = m_activities.at(id);
        if (activity.ownerId == ownerId && activity.IsLive())
        {
            result.push_back(&activity);
        }
    }
    return result;
}

float ActivitySystem::GetPerformance(const std::string& activityId) const
{
    const Activity* activity = GetActivity(activityId);
    return activity != nullptr ? activity->performanceScore : 0.0F;
}

bool ActivitySystem::IsRiskBearing(const std::string& riskTag) const
{
    return std::any_of(m_tuning.riskKeywords.begin(), m_tuning.riskKeywords.end(), [&](const std::string& keyword) {
        return !keyword.empty() && riskTag.find(keyword) != std::string::npos;
    });
}

float ActivitySystem::AttentionFor(const std::string& riskTag) const
{
    if (riskTag.empty())
    {
        return m_tuning.emptyTagAttention;
    }
    for (const auto& [keyword, attention] : m_tuning.attentionKeywords)
    {
        if (!keyword.empty() && riskTag.find(keyword) != std::string::npos)
        {
            return attention;
        }
    }
    return m_tuning.defaultAttention;
}

std::vector<ActivityResult> ActivitySystem::TakeFinishedResults()
{
    std::vector<ActivityResult> results;
    results.swap(m_finished);
    return results;
}

void ActivitySystem::SetPerformanceSample(const std::string& activityId, float sample)
{
    if (FindActivity(activityId) == nullptr)
    {
        std::cout << "[Activity] WARNING - SetPerformanceSample: activity '" << activityId << "' not found\n";
        return;
    }
    m_performanceSamples[activityId] = std::clamp(sample, 0.0F, kMaxPerformance);
}

void ActivitySystem::SetForcedDetection(const std::string& activityId, bool detected)
{
    if (detected)
    {
        m_forcedDetections.insert(activityId);
    }
    else
    {
        m_forcedDetections.erase(activityId);
    }
}

void ActivitySystem::SetPhases(const std::string& activityId, const std::vector<ActivityPhase>& phases)
{
    Activity* activity = FindActivity(activityId);
    if (activity == nullptr)
    {
        std::cout << "[Activity] WARNING - SetPhases: activity '" << activityId << "' not found\n";
        return;
    }

    activity->phases = phases;
    activity->currentPhaseIndex = 0;
    activity->phaseStartSeconds = activity->elapsedSeconds;
    if (!activity->phases.empty())
    {
        ApplyPhase(*activity);
    }
}

void ActivitySystem::SetState(Activity& activity, ActivityState state, const char* eventName)
{
    if (activity.state == state)
    {
        return;
    }
    activity.state = state;
    Publish(eventName, {activity.id, activity.ownerId});
}

void ActivitySystem::Publish(const std::string& name, std::vector<std::string> args, float value)
{
    if (m_eventBus == nullptr)
    {
        return;
    }
    m_eventBus->Publish(engine::core::Event{name, std::move(args), value});
}

const char* ActivityKindToText(ActivityKind kind)
{
    switch (kind)
    {
        case ActivityKind::Physical: return "physical";
        case ActivityKind::Screen: return "screen";
        case ActivityKind::Passive: return "passive";
        default: return "unknown";
    }
}

const char* ActivityStateToText(ActivityState state)
{
    switch (state)
    {
        case ActivityState::Active: return "active";
        case ActivityState::Running: return "running";
        case ActivityState::Paused: return "paused";
        case ActivityState::Failed: return "failed";
        case ActivityState::Completed: return "completed";
        default: return "unknown";
    }
}
} // namespace hustle::gameplay
