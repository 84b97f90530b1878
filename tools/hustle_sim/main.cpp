#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>

#include "hustle/gameplay/Collaborators.hpp"
#include "hustle/gameplay/SuspicionLoop.hpp"
#include "hustle/gameplay/TuningConfig.hpp"

namespace
{
using namespace hustle::gameplay;

class LedgerStub final : public EconomyLink
{
public:
    float GetLegitimacyRatio(const std::string& /*actorId*/) const override { return m_legitimacy; }
    float GetBalance(const std::string& /*actorId*/) const override { return m_balance; }
    void FreezeFunds(const std::string& /*actorId*/, float amount) override { m_frozen += amount; }
    void UnfreezeFunds(const std::string& /*actorId*/, float amount) override { m_frozen = std::max(0.0F, m_frozen - amount); }
    void ChargeFine(const std::string& /*actorId*/, float amount, const std::string& reason) override
    {
        m_balance -= amount;
        std::cout << "[Ledger] Fine " << amount << " (" << reason << ")\n";
    }

    float m_legitimacy = 0.4F;
    float m_balance = 2500.0F;
    float m_frozen = 0.0F;
};

void PrintStatus(SuspicionLoop& loop, const std::string& label)
{
    HeatSystem& heat = loop.Heat();
    std::cout << std::fixed << std::setprecision(2)
              << "[Sim] " << label
              << " | day " << loop.Clock().DayIndex()
              << " | heat " << heat.GetLevel()
              << " | patrol x" << loop.Dials().patrolFrequency
              << " | sensitivity x" << loop.Dials().detectionSensitivity
              << " | risk " << loop.Detection().GetDetectionRisk(heat.GetActorId(), "deal_drugs", "office")
              << (heat.IsSurveillanceActive() ? " | SURVEILLANCE" : "")
              << (heat.IsAuditActive() ? " | AUDIT" : "")
              << (heat.IsWarrantActive() ? " | WARRANT" : "")
              << "\n";
}
void PrintRoster(SuspicionLoop& loop)
{
    for (const std::string& id : loop.Detection().ListObservers())
    {
        const Observer* observer = loop.Detection().GetObserver(id);
        std::cout << "[Sim] Observer '" << id << "' (" << ObserverRoleToText(observer->data.role) << ") in "
                  << observer->data.currentLocation << "\n";
    }
    for (const Activity* activity : loop.Activities().GetActiveActivities(loop.Heat().GetActorId()))
    {
        std::cout << "[Sim] Activity '" << activity->riskTag << "' " << ActivityKindToText(activity->kind) << ", "
                  << ActivityStateToText(activity->state) << "\n";
    }
}
} // namespace

int main(int argc, char** argv)
{
    TuningConfig config;
    const std::string tuningPath = argc > 1 ? argv[1] : std::string(HUSTLE_SOURCE_DIR) + "/config/hustle_tuning.json";
    if (!LoadTuningFromJson(tuningPath, config))
    {
        std::cout << "[Sim] Using built-in tuning defaults\n";
    }

    SuspicionLoop loop(config);
    LedgerStub ledger;
    loop.Heat().SetEconomyLink(&ledger);

    loop.Bus().Subscribe("investigation_triggered", [](const engine::core::Event& event) {
        std::cout << "[Sim] >>> Investigation: " << event.Arg(0) << "\n";
    });

    DetectionSystem& detection = loop.Detection();
    detection.RegisterActivityProfile("deal_drugs", ActivityProfile{false, 0.8F});
    detection.SetActorPose("player", {0.0F, 0.0F, 3.0F}, "office");

    ObserverData boss;
    boss.role = ObserverRole::Boss;
    boss.facing = {0.0F, 0.0F, 1.0F};
    boss.visionRange = 6.0F;
    boss.visionConeDegrees = 120.0F;
    boss.caresAboutJobPerformance = true;
    boss.currentLocation = "office";
    detection.RegisterObserver("boss", boss);

    ObserverData guard;
    guard.role = ObserverRole::Security;
    guard.position = {4.0F, 0.0F, 0.0F};
    guard.facing = {-1.0F, 0.0F, 0.0F};
    guard.visionRange = 8.0F;
    guard.visionConeDegrees = 90.0F;
    guard.caresAboutLegality = true;
    guard.currentLocation = "office";
    detection.RegisterObserver("guard", guard);
    detection.SetPatrolPattern("guard", {{4.0F, 0.0F, 0.0F}, {4.0F, 0.0F, 6.0F}, {-4.0F, 0.0F, 6.0F}}, 5.0F);

    ActivitySystem& activities = loop.Activities();
    const std::string shift = activities.Create(ActivityKind::Physical, "work_filing", 60.0F);
    ActivitySpec dealSpec;
    dealSpec.kind = ActivityKind::Screen;
    dealSpec.riskTag = "deal_drugs";
    dealSpec.durationSeconds = 30.0F;
    dealSpec.requiredAttention = 0.3F;
    const std::string deal = activities.Create(dealSpec);
    PrintStatus(loop, "shift started");
    PrintRoster(loop);

    for (int second = 0; second < 40; ++second)
    {
        loop.Frame(1.0);
        for (const ActivityResult& result : activities.TakeFinishedResults())
        {
            std::cout << "[Sim] Finished '" << result.riskTag << "' score " << result.performanceScore
                      << (result.wasDetected ? " (caught)" : "") << "\n";
        }
    }
    PrintStatus(loop, "after shift");

    // The boss steps out for the afternoon.
    detection.SetObserverLocation("boss", "meeting_room");
    PrintRoster(loop);

    loop.Heat().OnSuspiciousTransaction(40000.0F, "DrugSale");
    loop.Heat().OnFlashyPurchase(95.0F);
    loop.Heat().AddHeat(35.0F, heat_sources::kDrugDealing);
    PrintStatus(loop, "after spending spree");

    for (const std::string& id : {shift, deal})
    {
        const ActivityResult result = activities.End(id);
        if (result.completed)
        {
            std::cout << "[Sim] Ended '" << result.riskTag << "' early, score " << result.performanceScore << "\n";
        }
    }

    // Let a month of game time pass so the audit deadline comes due.
    loop.Clock().SetTimeScale(60.0 * 24.0);
    for (int day = 0; day < 35; ++day)
    {
        loop.Step(1.0);
    }
    PrintStatus(loop, "a month later");
    return 0;
}
