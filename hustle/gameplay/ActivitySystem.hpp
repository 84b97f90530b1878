#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "hustle/gameplay/TuningConfig.hpp"

namespace engine::core
{
class EventBus;
}

namespace hustle::gameplay
{
class DetectionSystem;

enum class ActivityKind : std::uint8_t
{
    Physical,
    Screen,
    Passive
};

enum class MultitaskingLevel : std::uint8_t
{
    Full,
    Partial,
    Breaks,
    None
};

enum class ActivityState : std::uint8_t
{
    Active,
    Running,
    Paused,
    Failed,
    Completed
};

struct ActivityPhase
{
    std::string name;
    float durationSeconds = 0.0F;
    bool multitaskingAllowed = true;
    float attention = 0.5F;
};

struct Activity
{
    std::string id;
    std::string ownerId;
    ActivityKind kind = ActivityKind::Passive;
    std::string riskTag;
    MultitaskingLevel multitaskingLevel = MultitaskingLevel::Partial;
    float requiredAttention = 0.5F;
    float durationSeconds = 0.0F;
    ActivityState state = ActivityState::Active;
    float elapsedSeconds = 0.0F;
    float performanceScore = 50.0F;
    bool wasDetected = false;
    std::set<std::string> concurrentWith;
    std::vector<ActivityPhase> phases;
    std::size_t currentPhaseIndex = 0;
    float phaseStartSeconds = 0.0F;
    std::uint64_t creationOrder = 0;

    [[nodiscard]] bool IsLive() const { return state == ActivityState::Active || state == ActivityState::Running; }
};

/// Everything needed to start an activity. Unset fields fall back to tuning defaults.
struct ActivitySpec
{
    ActivityKind kind = ActivityKind::Passive;
    std::string riskTag;
    float durationSeconds = 0.0F;
    std::string ownerId;
    std::optional<float> requiredAttention;
    MultitaskingLevel multitaskingLevel = MultitaskingLevel::Partial;
};

struct ActivityResult
{
    std::string activityId;
    std::string ownerId;
    std::string riskTag;
    float performanceScore = 0.0F;
    float elapsedSeconds = 0.0F;
    bool completed = false;
    bool wasDetected = false;
};

/// Lifecycle of concurrently running player activities.
/// Starting an activity pauses every live activity of the same owner it cannot be
/// combined with; the newcomer always proceeds. Compatibility is checked at
/// creation and resume only, never continuously.
class ActivitySystem
{
public:
    explicit ActivitySystem(
        ActivityTuning tuning = {},
        DetectionSystem* detection = nullptr,
        engine::core::EventBus* eventBus = nullptr
    );

    std::string Create(ActivityKind kind, const std::string& riskTag, float durationSeconds);
    std::string Create(const ActivitySpec& spec);

    void Pause(const std::string& activityId);
    void Resume(const std::string& activityId);

    /// Ends and removes the activity. Unknown or already ended ids yield a default, not completed, result.
    ActivityResult End(const std::string& activityId);
    /// Like End but marks the run as failed.
    ActivityResult Fail(const std::string& activityId);

    /// Advances every live activity by deltaSeconds.
    void Update(float deltaSeconds);

    [[nodiscard]] bool CanMultitask(const std::string& firstId, const std::string& secondId) const;
    [[nodiscard]] static bool AreCompatible(const Activity& first, const Activity& second);

    [[nodiscard]] const Activity* GetActivity(const std::string& activityId) const;
    [[nodiscard]] std::vector<const Activity*> GetActiveActivities(const std::string& ownerId) const;
    [[nodiscard]] float GetPerformance(const std::string& activityId) const;
    [[nodiscard]] std::size_t ActivityCount() const { return m_activities.size(); }

    [[nodiscard]] bool IsRiskBearing(const std::string& riskTag) const;
    [[nodiscard]] float AttentionFor(const std::string& riskTag) const;

    /// Results of activities that finished on their own during Update. Each is handed out once.
    /// The host drains this; past ActivityTuning::maxFinishedResults the oldest entries are dropped.
    [[nodiscard]] std::vector<ActivityResult> TakeFinishedResults();

    // Deterministic hooks for minigames, tests and replays
    void SetPerformanceSample(const std::string& activityId, float sample);
    void SetForcedDetection(const std::string& activityId, bool detected);
    void SetPhases(const std::string& activityId, const std::vector<ActivityPhase>& phases);

private:
    Activity* FindActivity(const std::string& activityId);
    ActivityResult Finish(const std::string& activityId, ActivityState terminalState);
    void RunDetection(Activity& activity);
    void AdvancePhases(Activity& activity);
    void ApplyPhase(Activity& activity);
    void SetState(Activity& activity, ActivityState state, const char* eventName);
    void Publish(const std::string& name, std::vector<std::string> args, float value = 0.0F);

    ActivityTuning m_tuning;
    DetectionSystem* m_detection = nullptr;
    engine::core::EventBus* m_eventBus = nullptr;

    std::unordered_map<std::string, Activity> m_activities;
    std::vector<std::string> m_creationOrder;
    std::unordered_map<std::string, float> m_performanceSamples;
    std::unordered_set<std::string> m_forcedDetections;
    std::vector<ActivityResult> m_finished;
    std::uint64_t m_nextSerial = 1;
};

[[nodiscard]] const char* ActivityKindToText(ActivityKind kind);
[[nodiscard]] const char* ActivityStateToText(ActivityState state);
} // namespace hustle::gameplay
