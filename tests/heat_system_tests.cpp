#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "TestFakes.hpp"
#include "engine/core/EventBus.hpp"
#include "engine/core/GameClock.hpp"
#include "hustle/gameplay/DetectionSystem.hpp"
#include "hustle/gameplay/HeatSystem.hpp"

using namespace hustle::gameplay;
using hustle::testing::FakeEconomy;
using hustle::testing::FakeEvidence;

namespace
{
struct HeatFixture
{
    engine::core::GameClock clock;
    engine::core::EventBus bus;
    DetectionDials dials;
    DetectionSystem detection{dials};
    HeatSystem heat{clock, &detection, HeatTuning{}, &bus};
    FakeEconomy economy;
    std::vector<engine::core::Event> seen;

    HeatFixture()
    {
        for (const char* name : {"heat_threshold_crossed", "heat_cleared", "investigation_triggered", "audit_resolved", "warrant_cleared"})
        {
            bus.Subscribe(name, [this](const engine::core::Event& event) { seen.push_back(event); });
        }
    }

    /// Dispatches pending events and returns those with the given name.
    std::vector<engine::core::Event> Collect(const std::string& name)
    {
        bus.DispatchQueued();
        std::vector<engine::core::Event> out;
        for (const engine::core::Event& event : seen)
        {
            if (event.name == name)
            {
                out.push_back(event);
            }
        }
        return out;
    }
};
} // namespace

TEST_CASE("Heat: crossing 30 raises patrol frequency")
{
    HeatFixture f;
    f.heat.AddHeat(35.0F, heat_sources::kDrugDealing);

    CHECK(f.heat.GetLevel() == doctest::Approx(35.0F));
    CHECK(f.dials.patrolFrequency == doctest::Approx(1.2F));
    CHECK(f.dials.detectionSensitivity == doctest::Approx(1.0F));
    CHECK(f.heat.GetSourceAmount(heat_sources::kDrugDealing) == doctest::Approx(35.0F));
    CHECK_FALSE(f.heat.IsSurveillanceActive());

    const auto crossed = f.Collect("heat_threshold_crossed");
    REQUIRE(crossed.size() == 1);
    CHECK(crossed[0].value == doctest::Approx(30.0F));
}

TEST_CASE("Heat: crossing 70 with clean books triggers no audit")
{
    HeatFixture f;
    f.economy.legitimacy = 0.9F;
    f.heat.SetEconomyLink(&f.economy);
    f.heat.SetLevelForTesting(65.0F);

    f.heat.AddHeat(10.0F, heat_sources::kCashDeposit);

    CHECK(f.heat.GetLevel() == doctest::Approx(75.0F));
    CHECK_FALSE(f.heat.IsAuditActive());
    CHECK_FALSE(f.heat.IsSurveillanceActive());
    CHECK(f.economy.freezeCalls == 0);
    CHECK(f.Collect("investigation_triggered").empty());
}

TEST_CASE("Heat: crossing 70 without an economy link triggers no audit")
{
    HeatFixture f;
    f.heat.SetLevelForTesting(65.0F);
    f.heat.AddHeat(10.0F, heat_sources::kCashDeposit);
    CHECK_FALSE(f.heat.IsAuditActive());
}

TEST_CASE("Heat: an audit freezes funds and fines a shady ledger at the deadline")
{
    HeatFixture f;
    f.economy.legitimacy = 0.4F;
    f.heat.SetEconomyLink(&f.economy);
    f.heat.SetLevelForTesting(65.0F);

    f.heat.AddHeat(10.0F, heat_sources::kCashDeposit);
    REQUIRE(f.heat.IsAuditActive());
    CHECK(f.heat.GetInvestigations().audit.frozenAmount == doctest::Approx(300.0F));
    CHECK(f.economy.frozen == doctest::Approx(300.0F));
    CHECK(f.heat.GetInvestigations().audit.deadlineMinutes == doctest::Approx(30.0 * 1440.0));

    f.clock.Advance(29.0 * engine::core::GameClock::kMinutesPerDay);
    f.heat.Update(0.0);
    CHECK(f.heat.IsAuditActive());

    f.clock.Advance(engine::core::GameClock::kMinutesPerDay);
    f.heat.Update(0.0);
    CHECK_FALSE(f.heat.IsAuditActive());
    CHECK(f.economy.frozen == doctest::Approx(0.0F));
    CHECK(f.economy.totalFines == doctest::Approx(200.0F));
    CHECK(f.economy.balance == doctest::Approx(800.0F));

    const auto resolved = f.Collect("audit_resolved");
    REQUIRE(resolved.size() == 1);
    CHECK(resolved[0].Arg(0) == "fined");
    CHECK(resolved[0].value == doctest::Approx(200.0F));
}

TEST_CASE("Heat: an audit clears when the books improved")
{
    HeatFixture f;
    f.economy.legitimacy = 0.5F;
    f.heat.SetEconomyLink(&f.economy);
    f.heat.TriggerInvestigation(InvestigationType::Audit);
    REQUIRE(f.heat.IsAuditActive());

    f.economy.legitimacy = 0.8F;
    f.heat.ResolveAudit();
    CHECK_FALSE(f.heat.IsAuditActive());
    CHECK(f.economy.totalFines == doctest::Approx(0.0F));
    CHECK(f.economy.unfreezeCalls == 1);

    const auto resolved = f.Collect("audit_resolved");
    REQUIRE(resolved.size() == 1);
    CHECK(resolved[0].Arg(0) == "cleared");
}

TEST_CASE("Heat: a second audit while one runs is ignored")
{
    HeatFixture f;
    f.economy.legitimacy = 0.2F;
    f.heat.SetEconomyLink(&f.economy);
    f.heat.TriggerInvestigation(InvestigationType::Audit);
    f.heat.TriggerInvestigation(InvestigationType::Audit);

    CHECK(f.economy.freezeCalls == 1);
    CHECK(f.economy.frozen == doctest::Approx(300.0F));
    CHECK(f.Collect("investigation_triggered").size() == 1);
}

TEST_CASE("Heat: surveillance starts once and sharpens detection")
{
    HeatFixture f;
    f.heat.AddHeat(55.0F, heat_sources::kRecentArrest);
    f.heat.AddHeat(5.0F, heat_sources::kRecentArrest);

    CHECK(f.heat.IsSurveillanceActive());
    CHECK(f.dials.patrolFrequency == doctest::Approx(1.8F));
    CHECK(f.dials.detectionSensitivity == doctest::Approx(1.3F));

    const auto triggered = f.Collect("investigation_triggered");
    REQUIRE(triggered.size() == 1);
    CHECK(triggered[0].Arg(0) == "surveillance");
    CHECK(triggered[0].Arg(1) == "player");

    f.heat.EndSurveillance();
    CHECK_FALSE(f.heat.IsSurveillanceActive());
    CHECK(f.dials.patrolFrequency == doctest::Approx(1.2F));
    CHECK(f.dials.detectionSensitivity == doctest::Approx(1.0F));
}

TEST_CASE("Heat: crossing 90 with evidence raids and halves heat")
{
    HeatFixture f;
    FakeEvidence evidence;
    evidence.hasEvidence = true;
    f.heat.SetEvidenceLink(&evidence);
    f.heat.SetLevelForTesting(85.0F);

    f.heat.AddHeat(10.0F, heat_sources::kDrugDealing);

    CHECK(f.heat.GetLevel() == doctest::Approx(47.5F));
    CHECK(f.heat.GetInvestigations().raidCount == 1);
    CHECK_FALSE(f.heat.IsWarrantActive());
}

TEST_CASE("Heat: crossing 90 without evidence issues a warrant")
{
    HeatFixture f;
    f.heat.SetEvidenceOverride(false);
    f.heat.SetLevelForTesting(85.0F);

    f.heat.AddHeat(10.0F, heat_sources::kDrugDealing);

    CHECK(f.heat.GetLevel() == doctest::Approx(95.0F));
    CHECK(f.heat.IsWarrantActive());
    CHECK(f.dials.patrolFrequency == doctest::Approx(2.0F));

    f.heat.ClearWarrant();
    CHECK_FALSE(f.heat.IsWarrantActive());
    CHECK(f.dials.patrolFrequency == doctest::Approx(1.0F));

    f.heat.ClearWarrant();
    CHECK(f.dials.patrolFrequency == doctest::Approx(1.0F));
    CHECK(f.Collect("warrant_cleared").size() == 1);
}

TEST_CASE("Heat: the evidence override wins over the evidence link")
{
    HeatFixture f;
    FakeEvidence evidence;
    evidence.hasEvidence = true;
    f.heat.SetEvidenceLink(&evidence);
    f.heat.SetEvidenceOverride(false);
    f.heat.SetLevelForTesting(89.0F);

    f.heat.AddHeat(2.0F, heat_sources::kDrugDealing);
    CHECK(f.heat.IsWarrantActive());
    CHECK(f.heat.GetInvestigations().raidCount == 0);
}

TEST_CASE("Heat: one jump across every threshold applies every effect")
{
    HeatFixture f;
    f.economy.legitimacy = 0.4F;
    f.heat.SetEconomyLink(&f.economy);
    f.heat.SetEvidenceOverride(false);

    f.heat.AddHeat(95.0F, heat_sources::kDrugDealing);

    CHECK(f.heat.IsSurveillanceActive());
    CHECK(f.heat.IsAuditActive());
    CHECK(f.heat.IsWarrantActive());
    CHECK(f.dials.patrolFrequency == doctest::Approx(3.6F));
    CHECK(f.Collect("heat_threshold_crossed").size() == 4);
}

TEST_CASE("Heat: thresholds only fire on the way up")
{
    HeatFixture f;
    f.heat.SetLevelForTesting(40.0F);
    f.heat.ReduceHeat(20.0F);
    f.heat.AddHeat(5.0F, heat_sources::kFlashyPurchase);
    CHECK(f.dials.patrolFrequency == doctest::Approx(1.0F));
    CHECK(f.Collect("heat_threshold_crossed").empty());
}

TEST_CASE("Heat: level is clamped and bad amounts are ignored")
{
    HeatFixture f;
    f.heat.AddHeat(-5.0F, heat_sources::kDrugDealing);
    f.heat.AddHeat(0.0F, heat_sources::kDrugDealing);
    CHECK(f.heat.GetLevel() == doctest::Approx(0.0F));
    CHECK(f.heat.GetSources().empty());

    f.heat.SetEvidenceOverride(false);
    f.heat.AddHeat(150.0F, "");
    CHECK(f.heat.GetLevel() == doctest::Approx(100.0F));
    CHECK(f.heat.GetSourceAmount(heat_sources::kUnknown) > 0.0F);

    f.heat.ReduceHeat(500.0F);
    CHECK(f.heat.GetLevel() == doctest::Approx(0.0F));
    CHECK(f.Collect("heat_cleared").size() == 1);
}

TEST_CASE("Heat: reductions drain the named bucket or the largest one")
{
    HeatFixture f;
    f.heat.AddHeat(10.0F, heat_sources::kDrugDealing);
    f.heat.AddHeat(20.0F, heat_sources::kFlashyPurchase);

    f.heat.ReduceHeat(5.0F, heat_sources::kDrugDealing);
    CHECK(f.heat.GetSourceAmount(heat_sources::kDrugDealing) == doctest::Approx(5.0F));
    CHECK(f.heat.GetLevel() == doctest::Approx(25.0F));

    f.heat.ReduceHeat(5.0F, "bribe");
    CHECK(f.heat.GetSourceAmount(heat_sources::kFlashyPurchase) == doctest::Approx(15.0F));

    f.heat.ReduceHeat(20.0F);
    CHECK(f.heat.GetSourceAmount(heat_sources::kFlashyPurchase) == doctest::Approx(0.0F));
    CHECK(f.heat.GetSourceAmount(heat_sources::kDrugDealing) == doctest::Approx(5.0F));
    CHECK(f.heat.GetLevel() == doctest::Approx(0.0F));

    const std::vector<HeatSource> sources = f.heat.GetSources();
    REQUIRE(sources.size() == 2);
    CHECK(sources[0].cause == heat_sources::kDrugDealing);
    CHECK(sources[1].cause == heat_sources::kFlashyPurchase);
}

TEST_CASE("Heat: equal buckets drain the earliest seen first")
{
    HeatFixture f;
    f.heat.AddHeat(10.0F, heat_sources::kCashDeposit);
    f.heat.AddHeat(10.0F, heat_sources::kSuspiciousIncome);

    f.heat.ReduceHeat(3.0F);
    CHECK(f.heat.GetSourceAmount(heat_sources::kCashDeposit) == doctest::Approx(7.0F));
    CHECK(f.heat.GetSourceAmount(heat_sources::kSuspiciousIncome) == doctest::Approx(10.0F));
}

TEST_CASE("Heat: decay rate depends on time since the last increase")
{
    HeatFixture f;
    f.heat.SetLevelForTesting(24.0F);

    SUBCASE("fresh heat decays at half rate")
    {
        f.heat.Update(24.0);
        CHECK(f.heat.CurrentDecayMultiplier() == doctest::Approx(0.5F));
        CHECK(f.heat.GetLevel() == doctest::Approx(23.5F));
    }

    SUBCASE("a day old decays at the base rate")
    {
        f.clock.Advance(1.0 * engine::core::GameClock::kMinutesPerDay);
        f.heat.Update(24.0);
        CHECK(f.heat.GetLevel() == doctest::Approx(23.0F));
    }

    SUBCASE("exactly a week old still decays at the base rate")
    {
        f.clock.Advance(7.0 * engine::core::GameClock::kMinutesPerDay);
        CHECK(f.heat.CurrentDecayMultiplier() == doctest::Approx(1.0F));
    }

    SUBCASE("over a week old decays twice as fast")
    {
        f.clock.Advance(10.0 * engine::core::GameClock::kMinutesPerDay);
        f.heat.Update(24.0);
        CHECK(f.heat.GetLevel() == doctest::Approx(22.0F));
    }

    SUBCASE("over a month old decays three times as fast")
    {
        f.clock.Advance(40.0 * engine::core::GameClock::kMinutesPerDay);
        f.heat.Update(24.0);
        CHECK(f.heat.GetLevel() == doctest::Approx(21.0F));
    }

    SUBCASE("an increase makes the heat fresh again")
    {
        f.clock.Advance(40.0 * engine::core::GameClock::kMinutesPerDay);
        f.heat.AddHeat(1.0F, heat_sources::kFlashyPurchase);
        CHECK(f.heat.CurrentDecayMultiplier() == doctest::Approx(0.5F));
    }

    SUBCASE("the last increase can be rewound for replays")
    {
        f.heat.SetLastIncreaseForTesting(-10.0 * engine::core::GameClock::kMinutesPerDay);
        CHECK(f.heat.CurrentDecayMultiplier() == doctest::Approx(2.0F));
    }
}

TEST_CASE("Heat: decay leaves source attribution alone and stops at zero")
{
    HeatFixture f;
    f.heat.AddHeat(1.0F, heat_sources::kFlashyPurchase);
    f.clock.Advance(40.0 * engine::core::GameClock::kMinutesPerDay);

    f.heat.Update(24.0);
    CHECK(f.heat.GetLevel() == doctest::Approx(0.0F));
    CHECK(f.heat.GetSourceAmount(heat_sources::kFlashyPurchase) == doctest::Approx(1.0F));
    CHECK(f.Collect("heat_cleared").size() == 1);

    f.heat.Update(24.0);
    CHECK(f.heat.GetLevel() == doctest::Approx(0.0F));
}

TEST_CASE("Heat: timed modifiers withdraw their heat on expiry")
{
    HeatFixture f;
    f.heat.AddModifier(heat_sources::kRecentArrest, 10.0F, 2.0);
    f.heat.AddModifier(heat_sources::kRepeatOffender, 5.0F, std::nullopt);
    CHECK(f.heat.GetLevel() == doctest::Approx(15.0F));
    CHECK(f.heat.GetState().activeModifiers.size() == 2);

    f.clock.Advance(1.0 * engine::core::GameClock::kMinutesPerHour);
    f.heat.Update(0.0);
    CHECK(f.heat.GetLevel() == doctest::Approx(15.0F));

    f.clock.Advance(1.0 * engine::core::GameClock::kMinutesPerHour);
    f.heat.Update(0.0);
    CHECK(f.heat.GetLevel() == doctest::Approx(5.0F));
    CHECK(f.heat.GetSourceAmount(heat_sources::kRecentArrest) == doctest::Approx(0.0F));
    REQUIRE(f.heat.GetState().activeModifiers.size() == 1);
    CHECK(f.heat.GetState().activeModifiers[0].permanent);
}

TEST_CASE("Heat: an expiring modifier only withdraws what is left of its bucket")
{
    HeatFixture f;
    f.heat.AddHeat(20.0F, heat_sources::kDrugDealing);
    f.heat.AddModifier(heat_sources::kRecentArrest, 10.0F, 1.0);
    f.heat.ReduceHeat(6.0F, heat_sources::kRecentArrest);
    CHECK(f.heat.GetLevel() == doctest::Approx(24.0F));

    f.clock.Advance(engine::core::GameClock::kMinutesPerHour);
    f.heat.Update(0.0);
    CHECK(f.heat.GetLevel() == doctest::Approx(20.0F));
    CHECK(f.heat.GetSourceAmount(heat_sources::kDrugDealing) == doctest::Approx(20.0F));
}

TEST_CASE("Heat: economy signals")
{
    HeatFixture f;

    SUBCASE("large deposits scale with size")
    {
        f.heat.OnSuspiciousTransaction(20000.0F, "Salary");
        CHECK(f.heat.GetSourceAmount(heat_sources::kCashDeposit) == doctest::Approx(10.0F));
        CHECK(f.heat.GetSourceAmount(heat_sources::kSuspiciousIncome) == doctest::Approx(0.0F));
    }

    SUBCASE("small deposits go unnoticed")
    {
        f.heat.OnSuspiciousTransaction(5000.0F, "salary");
        CHECK(f.heat.GetLevel() == doctest::Approx(0.0F));
    }

    SUBCASE("illicit income is flagged regardless of case")
    {
        f.heat.OnSuspiciousTransaction(100.0F, "DrugSale");
        f.heat.OnSuspiciousTransaction(100.0F, "SEXWORK");
        CHECK(f.heat.GetSourceAmount(heat_sources::kSuspiciousIncome) == doctest::Approx(4.0F));
    }

    SUBCASE("flashy purchases above the vanity threshold")
    {
        f.heat.OnFlashyPurchase(70.0F);
        CHECK(f.heat.GetLevel() == doctest::Approx(0.0F));
        f.heat.OnFlashyPurchase(80.0F);
        CHECK(f.heat.GetSourceAmount(heat_sources::kFlashyPurchase) == doctest::Approx(8.0F));
    }
}

TEST_CASE("Heat: state can be restored and reset")
{
    HeatFixture f;
    HeatState saved;
    saved.level = 140.0F;
    saved.sources.push_back(HeatSource{heat_sources::kDrugDealing, 40.0F});
    f.heat.SetState(saved);
    CHECK(f.heat.GetLevel() == doctest::Approx(100.0F));
    CHECK(f.heat.GetSourceAmount(heat_sources::kDrugDealing) == doctest::Approx(40.0F));

    InvestigationState investigations;
    investigations.warrantActive = true;
    f.heat.SetInvestigations(investigations);
    CHECK(f.heat.IsWarrantActive());

    f.heat.Reset();
    CHECK(f.heat.GetLevel() == doctest::Approx(0.0F));
    CHECK(f.heat.GetSources().empty());
    CHECK_FALSE(f.heat.IsWarrantActive());
}

TEST_CASE("Heat: investigation names")
{
    CHECK(std::string(InvestigationTypeToText(InvestigationType::Surveillance)) == "surveillance");
    CHECK(std::string(InvestigationTypeToText(InvestigationType::ArrestWarrant)) == "arrest_warrant");
}

TEST_CASE("Heat: decay never raises the level and bites once the heat is a day old")
{
    HeatFixture f;
    f.heat.AddHeat(20.0F, heat_sources::kFlashyPurchase);

    float previous = f.heat.GetLevel();
    for (int hour = 1; hour <= 48; ++hour)
    {
        f.clock.Advance(engine::core::GameClock::kMinutesPerHour);
        f.heat.Update(1.0);
        const float level = f.heat.GetLevel();
        CHECK(level <= previous);
        if (hour > 24)
        {
            CHECK(level < previous);
        }
        previous = level;
    }
}

TEST_CASE("Heat: wobbling above 50 does not restart surveillance")
{
    HeatFixture f;
    f.heat.AddHeat(55.0F, heat_sources::kDrugDealing);
    f.heat.ReduceHeat(4.0F);
    f.heat.AddHeat(3.0F, heat_sources::kDrugDealing);
    f.heat.ReduceHeat(2.0F);
    f.heat.AddHeat(6.0F, heat_sources::kDrugDealing);

    CHECK(f.dials.detectionSensitivity == doctest::Approx(1.3F));
    CHECK(f.Collect("investigation_triggered").size() == 1);
}

TEST_CASE("Heat: a second warrant crossing does not stack the patrol boost")
{
    HeatFixture f;
    f.heat.SetEvidenceOverride(false);

    f.heat.SetLevelForTesting(85.0F);
    f.heat.AddHeat(10.0F, heat_sources::kDrugDealing);
    f.heat.SetLevelForTesting(85.0F);
    f.heat.AddHeat(10.0F, heat_sources::kDrugDealing);
    CHECK(f.dials.patrolFrequency == doctest::Approx(2.0F));
    CHECK(f.Collect("heat_threshold_crossed").size() == 2);

    f.heat.ClearWarrant();
    CHECK_FALSE(f.heat.IsWarrantActive());
    CHECK(f.dials.patrolFrequency == doctest::Approx(1.0F));
}

TEST_CASE("Heat: re-crossing 50 during surveillance leaves the dials alone once it ends")
{
    HeatFixture f;

    f.heat.SetLevelForTesting(45.0F);
    f.heat.AddHeat(10.0F, heat_sources::kRecentArrest);
    f.heat.SetLevelForTesting(45.0F);
    f.heat.AddHeat(10.0F, heat_sources::kRecentArrest);
    CHECK(f.dials.patrolFrequency == doctest::Approx(1.5F));
    CHECK(f.dials.detectionSensitivity == doctest::Approx(1.3F));
    CHECK(f.Collect("investigation_triggered").size() == 1);

    f.heat.EndSurveillance();
    CHECK_FALSE(f.heat.IsSurveillanceActive());
    CHECK(f.dials.patrolFrequency == doctest::Approx(1.0F));
    CHECK(f.dials.detectionSensitivity == doctest::Approx(1.0F));
}
