#include "hustle/gameplay/HeatSystem.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <utility>

#include "engine/core/EventBus.hpp"
#include "engine/core/GameClock.hpp"
#include "hustle/gameplay/Collaborators.hpp"
#include "hustle/gameplay/DetectionSystem.hpp"

namespace hustle::gameplay
{
namespace
{
constexpr float kMinHeat = 0.0F;
constexpr float kMaxHeat = 100.0F;
constexpr float kLevelEpsilon = 1.0e-6F;
constexpr float kHeatPerDepositUnit = 10000.0F;

enum ThresholdIndex : std::size_t
{
    kWatchThreshold = 0,
    kSurveillanceThreshold = 1,
    kAuditThreshold = 2,
    kRaidThreshold = 3
};
}

HeatSystem::HeatSystem(
    engine::core::GameClock& clock,
    DetectionSystem* detection,
    HeatTuning tuning,
    engine::core::EventBus* eventBus
)
    : m_clock(clock)
    , m_detection(detection)
    , m_tuning(std::move(tuning))
    , m_eventBus(eventBus)
    , m_rng(m_tuning.randomSeed)
{
    m_state.lastIncreaseMinutes = m_clock.NowMinutes();
}

void HeatSystem::AddHeat(float amount, const std::string& cause)
{
    if (amount <= 0.0F || !std::isfinite(amount))
    {
        return;
    }

    const std::string bucket = cause.empty() ? heat_sources::kUnknown : cause;
    const float oldLevel = m_state.level;
    m_state.level = std::clamp(m_state.level + amount, kMinHeat, kMaxHeat);
    m_state.lastIncreaseMinutes = m_clock.NowMinutes();
    SourceBucket(bucket).amount += amount;

    if (m_tuning.verboseLogging)
    {
        std::cout << "[Heat] +" << amount << " (" << bucket << ") -> " << m_state.level << "\n";
    }
    Publish("heat_increased", {bucket}, amount);
    CheckThresholds(oldLevel, m_state.level);
}

void HeatSystem::ReduceHeat(float amount, const std::string& cause)
{
    if (amount <= 0.0F || !std::isfinite(amount))
    {
        return;
    }

    DrainSource(amount, cause);
    LowerLevel(std::clamp(m_state.level - amount, kMinHeat, kMaxHeat), amount);
}

void HeatSystem::LowerLevel(float newLevel, float reportedAmount)
{
    const float oldLevel = m_state.level;
    m_state.level = newLevel;

    if (std::abs(oldLevel - newLevel) > kLevelEpsilon)
    {
        Publish("heat_decreased", {}, reportedAmount);
    }
    if (newLevel <= kMinHeat && oldLevel > kMinHeat)
    {
        std::cout << "[Heat] Heat cleared\n";
        Publish("heat_cleared", {});
    }
}

void HeatSystem::DrainSource(float amount, const std::string& cause)
{
    if (m_state.sources.empty())
    {
        return;
    }

    HeatSource* target = nullptr;
    if (!cause.empty())
    {
        const auto it = std::find_if(m_state.sources.begin(), m_state.sources.end(), [&](const HeatSource& source) {
            return source.cause == cause;
        });
        if (it != m_state.sources.end())
        {
            target = &*it;
        }
    }

    if (target == nullptr)
    {
        // Strict comparison keeps the earliest-seen bucket on ties.
        for (HeatSource& source : m_state.sources)
        {
            if (source.amount > kMinHeat && (target == nullptr || source.amount > target->amount))
            {
                target = &source;
            }
        }
    }

    if (target != nullptr)
    {
        target->amount = std::max(kMinHeat, target->amount - amount);
    }
}

void HeatSystem::Update(double deltaGameHours)
{
    ExpireModifiers();
    if (deltaGameHours > 0.0)
    {
        ApplyDecay(deltaGameHours);
    }
    ResolveAuditIfDue();
}

float HeatSystem::CurrentDecayMultiplier() const
{
    const double daysSinceIncrease =
        (m_clock.NowMinutes() - m_state.lastIncreaseMinutes) / engine::core::GameClock::kMinutesPerDay;

    if (daysSinceIncrease < m_tuning.freshDays)
    {
        return m_tuning.freshDecayMultiplier;
    }
    if (daysSinceIncrease > m_tuning.coldDays)
    {
        return m_tuning.coldDecayMultiplier;
    }
    if (daysSinceIncrease > m_tuning.staleDays)
    {
        return m_tuning.staleDecayMultiplier;
    }
    return m_tuning.normalDecayMultiplier;
}

void HeatSystem::ApplyDecay(double deltaGameHours)
{
    if (m_state.level <= kMinHeat)
    {
        return;
    }

    const float decay = static_cast<float>(m_tuning.baseDecayPerHour * CurrentDecayMultiplier() * deltaGameHours);
    if (decay <= 0.0F)
    {
        return;
    }
    LowerLevel(std::max(kMinHeat, m_state.level - decay), decay);
}

float HeatSystem::GetSourceAmount(const std::string& cause) const
{
    for (const HeatSource& source : m_state.sources)
    {
        if (source.cause == cause)
        {
            return source.amount;
        }
    }
    return 0.0F;
}

HeatSource& HeatSystem::SourceBucket(const std::string& cause)
{
    for (HeatSource& source : m_state.sources)
    {
        if (source.cause == cause)
        {
            return source;
        }
    }
    m_state.sources.push_back(HeatSource{cause, 0.0F});
    return m_state.sources.back();
}

void HeatSystem::AddModifier(const std::string& source, float amount, std::optional<double> durationHours)
{
    if (amount <= 0.0F)
    {
        return;
    }

    HeatModifier modifier;
    modifier.source = source.empty() ? heat_sources::kUnknown : source;
    modifier.amount = amount;
    modifier.permanent = !durationHours.has_value();
    modifier.expiresAtMinutes =
        m_clock.NowMinutes() + durationHours.value_or(0.0) * engine::core::GameClock::kMinutesPerHour;
    m_state.activeModifiers.push_back(modifier);

    AddHeat(amount, modifier.source);
}

void HeatSystem::ExpireModifiers()
{
    const double now = m_clock.NowMinutes();
    std::vector<HeatModifier> expired;
    auto& modifiers = m_state.activeModifiers;
    for (auto it = modifiers.begin(); it != modifiers.end();)
    {
        if (!it->permanent && now >= it->expiresAtMinutes)
        {
            expired.push_back(*it);
            it = modifiers.erase(it);
        }
        else
        {
            ++it;
        }
    }

    for (const HeatModifier& modifier : expired)
    {
        const float withdraw = std::min(modifier.amount, GetSourceAmount(modifier.source));
        if (withdraw > kMinHeat)
        {
            ReduceHeat(withdraw, modifier.source);
        }
    }
}

void HeatSystem::OnSuspiciousTransaction(float amount, const std::string& source)
{
    if (amount > m_tuning.largeDepositAmount)
    {
        AddHeat((amount / kHeatPerDepositUnit) * m_tuning.depositHeatPer10k, heat_sources::kCashDeposit);
    }

    std::string lowered = source;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "drugsale" || lowered == "sexwork")
    {
        AddHeat(m_tuning.suspiciousIncomeHeat, heat_sources::kSuspiciousIncome);
    }
}

void HeatSystem::OnFlashyPurchase(float vanityValue)
{
    if (vanityValue > m_tuning.flashyVanityThreshold)
    {
        AddHeat((vanityValue / 100.0F) * m_tuning.flashyHeatPer100Vanity, heat_sources::kFlashyPurchase);
    }
}

void HeatSystem::CheckThresholds(float oldLevel, float newLevel)
{
    for (std::size_t i = 0; i < m_tuning.thresholds.size(); ++i)
    {
        const float threshold = m_tuning.thresholds[i];
        if (oldLevel < threshold && newLevel >= threshold)
        {
            std::cout << "[Heat] Threshold " << threshold << " crossed (level " << newLevel << ")\n";
            Publish("heat_threshold_crossed", {}, threshold);
            HandleThreshold(i);
        }
    }
}

void HeatSystem::HandleThreshold(std::size_t thresholdIndex)
{
    switch (thresholdIndex)
    {
        case kWatchThreshold:
            if (m_detection != nullptr)
            {
                m_detection->SetPatrolFrequency(m_tuning.watchPatrolFactor);
            }
            break;
        case kSurveillanceThreshold:
            TriggerInvestigation(InvestigationType::Surveillance);
            break;
        case kAuditThreshold:
            if (ReadLegitimacy() < m_tuning.auditLegitimacyThreshold)
            {
                TriggerInvestigation(InvestigationType::Audit);
            }
            break;
        case kRaidThreshold:
            TriggerInvestigation(CheckForEvidence() ? InvestigationType::Raid : InvestigationType::ArrestWarrant);
            break;
        default:
            break;
    }
}

void HeatSystem::TriggerInvestigation(InvestigationType type)
{
    const std::string& actorId = m_tuning.actorId;

    switch (type)
    {
        case InvestigationType::Surveillance:
            if (m_investigations.surveillanceActive)
            {
                std::cout << "[Heat] Surveillance already running for '" << actorId << "'\n";
                return;
            }
            m_investigations.surveillanceActive = true;
            if (m_detection != nullptr)
            {
                m_detection->SetPatrolFrequency(m_tuning.surveillancePatrolFactor);
                m_detection->SetDetectionSensitivity(m_tuning.surveillanceSensitivityFactor);
            }
            break;
        case InvestigationType::Audit:
        {
            if (m_investigations.audit.active)
            {
                std::cout << "[Heat] WARNING - Audit already running for '" << actorId << "'\n";
                return;
            }
            AuditState& audit = m_investigations.audit;
            audit.active = true;
            audit.frozenAmount = m_economy != nullptr ? m_economy->GetBalance(actorId) * m_tuning.auditFreezeFraction : 0.0F;
            audit.deadlineMinutes =
                m_clock.NowMinutes() + static_cast<double>(m_tuning.auditWindowDays) * engine::core::GameClock::kMinutesPerDay;
            if (m_economy != nullptr && audit.frozenAmount > 0.0F)
            {
                m_economy->FreezeFunds(actorId, audit.frozenAmount);
            }
            break;
        }
        case InvestigationType::Raid:
        {
            ++m_investigations.raidCount;
            const float halved = m_state.level * m_tuning.raidHeatFactor;
            LowerLevel(halved, m_state.level - halved);
            break;
        }
        case InvestigationType::ArrestWarrant:
            if (m_investigations.warrantActive)
            {
                std::cout << "[Heat] Warrant already out for '" << actorId << "'\n";
                return;
            }
            m_investigations.warrantActive = true;
            if (m_detection != nullptr)
            {
                m_detection->SetPatrolFrequency(m_tuning.warrantPatrolFactor);
            }
            break;
    }

    std::cout << "[Heat] Investigation triggered: " << InvestigationTypeToText(type) << "\n";
    Publish("investigation_triggered", {InvestigationTypeToText(type), actorId}, static_cast<float>(type));
}

void HeatSystem::ResolveAuditIfDue()
{
    const AuditState& audit = m_investigations.audit;
    if (audit.active && m_clock.NowMinutes() >= audit.deadlineMinutes)
    {
        ResolveAudit();
    }
}

void HeatSystem::ResolveAudit()
{
    AuditState& audit = m_investigations.audit;
    if (!audit.active)
    {
        return;
    }

    const std::string& actorId = m_tuning.actorId;
    float fine = 0.0F;
    if (m_economy != nullptr)
    {
        m_economy->UnfreezeFunds(actorId, audit.frozenAmount);
        if (m_economy->GetLegitimacyRatio(actorId) <= m_tuning.auditClearLegitimacy)
        {
            fine = m_economy->GetBalance(actorId) * m_tuning.auditFineFraction;
            m_economy->ChargeFine(actorId, fine, "Tax evasion penalty");
        }
    }

    audit = AuditState{};
    std::cout << "[Heat] Audit resolved for '" << actorId << "' (fine " << fine << ")\n";
    Publish("audit_resolved", {fine > 0.0F ? "fined" : "cleared", actorId}, fine);
}

void HeatSystem::ClearWarrant()
{
    if (!m_investigations.warrantActive)
    {
        return;
    }
    m_investigations.warrantActive = false;
    if (m_detection != nullptr && m_tuning.warrantPatrolFactor > 0.0F)
    {
        m_detection->SetPatrolFrequency(1.0F / m_tuning.warrantPatrolFactor);
    }
    Publish("warrant_cleared", {m_tuning.actorId});
}

void HeatSystem::EndSurveillance()
{
    if (!m_investigations.surveillanceActive)
    {
        return;
    }
    m_investigations.surveillanceActive = false;
    if (m_detection != nullptr && m_tuning.surveillancePatrolFactor > 0.0F && m_tuning.surveillanceSensitivityFactor > 0.0F)
    {
        m_detection->SetPatrolFrequency(1.0F / m_tuning.surveillancePatrolFactor);
        m_detection->SetDetectionSensitivity(1.0F / m_tuning.surveillanceSensitivityFactor);
    }
}

bool HeatSystem::CheckForEvidence()
{
    if (m_evidenceOverride.has_value())
    {
        return *m_evidenceOverride;
    }
    if (m_evidence != nullptr)
    {
        return m_evidence->HasIncriminatingEvidence(m_tuning.actorId);
    }
    std::bernoulli_distribution roll(std::clamp(m_tuning.evidenceChance, 0.0F, 1.0F));
    return roll(m_rng);
}

float HeatSystem::ReadLegitimacy() const
{
    if (m_economy == nullptr)
    {
        // No ledger wired: nothing to audit.
        return 1.0F;
    }
    return m_economy->GetLegitimacyRatio(m_tuning.actorId);
}

void HeatSystem::SetState(const HeatState& state)
{
    m_state = state;
    m_state.level = std::clamp(m_state.level, kMinHeat, kMaxHeat);
}

void HeatSystem::Reset()
{
    m_state = HeatState{};
    m_state.lastIncreaseMinutes = m_clock.NowMinutes();
    m_investigations = InvestigationState{};
}

void HeatSystem::SetLevelForTesting(float level)
{
    m_state.level = std::clamp(level, kMinHeat, kMaxHeat);
}

void HeatSystem::Publish(const std::string& name, std::vector<std::string> args, float value)
{
    if (m_eventBus == nullptr)
    {
        return;
    }
    m_eventBus->Publish(engine::core::Event{name, std::move(args), value});
}

const char* InvestigationTypeToText(InvestigationType type)
{
    switch (type)
    {
        case InvestigationType::Surveillance: return "surveillance";
        case InvestigationType::Audit: return "audit";
        case InvestigationType::Raid: return "raid";
        case InvestigationType::ArrestWarrant: return "arrest_warrant";
        default: return "unknown";
    }
}
} // namespace hustle::gameplay
