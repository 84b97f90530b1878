#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "hustle/gameplay/TuningConfig.hpp"

namespace engine::core
{
class EventBus;
class GameClock;
}

namespace hustle::gameplay
{
class DetectionSystem;
class EconomyLink;
class EvidenceLink;

enum class InvestigationType : std::uint8_t
{
    Surveillance,
    Audit,
    Raid,
    ArrestWarrant
};

/// Well-known heat causes raised by the economy and the activity loop.
namespace heat_sources
{
inline constexpr const char* kDrugDealing = "drug_dealing";
inline constexpr const char* kFlashyPurchase = "flashy_purchase";
inline constexpr const char* kRecentArrest = "recent_arrest";
inline constexpr const char* kCashDeposit = "cash_deposit";
inline constexpr const char* kSuspiciousIncome = "suspicious_income";
inline constexpr const char* kRepeatOffender = "repeat_offender";
inline constexpr const char* kCaughtOnJob = "caught_on_job";
inline constexpr const char* kUnknown = "unknown";
} // namespace heat_sources

struct HeatSource
{
    std::string cause;
    float amount = 0.0F;
};

struct HeatModifier
{
    std::string source;
    float amount = 0.0F;
    double expiresAtMinutes = 0.0;
    bool permanent = false;
};

struct HeatState
{
    float level = 0.0F;
    std::vector<HeatSource> sources; // first-seen order
    double lastIncreaseMinutes = 0.0;
    std::vector<HeatModifier> activeModifiers;
};

struct AuditState
{
    bool active = false;
    float frozenAmount = 0.0F;
    double deadlineMinutes = 0.0;
};

struct InvestigationState
{
    bool surveillanceActive = false;
    bool warrantActive = false;
    AuditState audit;
    int raidCount = 0;
};

/// Suspicion accumulator for one tracked actor.
///
/// Heat rises through AddHeat with per-cause provenance, decays with game time
/// (slowly while fresh, faster once old), and escalates into investigations when
/// it crosses a threshold upwards. Investigations push the detection dials, so
/// the more heat the actor carries the easier they are to spot.
class HeatSystem
{
public:
    HeatSystem(
        engine::core::GameClock& clock,
        DetectionSystem* detection = nullptr,
        HeatTuning tuning = {},
        engine::core::EventBus* eventBus = nullptr
    );

    void SetEconomyLink(EconomyLink* economy) { m_economy = economy; }
    void SetEvidenceLink(const EvidenceLink* evidence) { m_evidence = evidence; }

    [[nodiscard]] float GetLevel() const { return m_state.level; }
    [[nodiscard]] const std::string& GetActorId() const { return m_tuning.actorId; }

    void AddHeat(float amount, const std::string& cause);
    /// Drains the named bucket, or the largest one (earliest seen on ties) when the cause is unknown or empty.
    void ReduceHeat(float amount, const std::string& cause = {});

    /// Decay, modifier expiry and audit deadlines.
    void Update(double deltaGameHours);

    [[nodiscard]] std::vector<HeatSource> GetSources() const { return m_state.sources; }
    [[nodiscard]] float GetSourceAmount(const std::string& cause) const;

    /// Adds heat now; a timed modifier withdraws what is left of its amount when it expires.
    void AddModifier(const std::string& source, float amount, std::optional<double> durationHours);

    // Economy signals
    void OnSuspiciousTransaction(float amount, const std::string& source);
    void OnFlashyPurchase(float vanityValue);

    // Investigations
    /// Surveillance, Audit and Warrant are no-ops while already active, so their dial changes never stack.
    void TriggerInvestigation(InvestigationType type);
    void ResolveAudit();
    void ClearWarrant();
    void EndSurveillance();
    [[nodiscard]] const InvestigationState& GetInvestigations() const { return m_investigations; }
    [[nodiscard]] bool IsAuditActive() const { return m_investigations.audit.active; }
    [[nodiscard]] bool IsWarrantActive() const { return m_investigations.warrantActive; }
    [[nodiscard]] bool IsSurveillanceActive() const { return m_investigations.surveillanceActive; }

    [[nodiscard]] float CurrentDecayMultiplier() const;

    // Snapshot for external persistence
    [[nodiscard]] const HeatState& GetState() const { return m_state; }
    void SetState(const HeatState& state);
    void SetInvestigations(const InvestigationState& investigations) { m_investigations = investigations; }
    void Reset();

    // Deterministic hooks for tests and replays
    void SetLevelForTesting(float level);
    void SetLastIncreaseForTesting(double gameMinutes) { m_state.lastIncreaseMinutes = gameMinutes; }
    void SetEvidenceOverride(std::optional<bool> hasEvidence) { m_evidenceOverride = hasEvidence; }
    void Reseed(std::uint32_t seed) { m_rng.seed(seed); }

private:
    void CheckThresholds(float oldLevel, float newLevel);
    void HandleThreshold(std::size_t thresholdIndex);
    void ApplyDecay(double deltaGameHours);
    void ExpireModifiers();
    void ResolveAuditIfDue();
    void DrainSource(float amount, const std::string& cause);
    void LowerLevel(float newLevel, float reportedAmount);
    [[nodiscard]] bool CheckForEvidence();
    [[nodiscard]] float ReadLegitimacy() const;
    HeatSource& SourceBucket(const std::string& cause);
    void Publish(const std::string& name, std::vector<std::string> args, float value = 0.0F);

    engine::core::GameClock& m_clock;
    DetectionSystem* m_detection = nullptr;
    HeatTuning m_tuning;
    engine::core::EventBus* m_eventBus = nullptr;
    EconomyLink* m_economy = nullptr;
    const EvidenceLink* m_evidence = nullptr;

    HeatState m_state;
    InvestigationState m_investigations;
    std::optional<bool> m_evidenceOverride;
    std::mt19937 m_rng;
};

[[nodiscard]] const char* InvestigationTypeToText(InvestigationType type);
} // namespace hustle::gameplay
