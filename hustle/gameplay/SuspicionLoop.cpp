#include "hustle/gameplay/SuspicionLoop.hpp"

#include <iostream>
#include <utility>

namespace hustle::gameplay
{
SuspicionLoop::SuspicionLoop(TuningConfig config)
    : m_config(std::move(config))
    , m_clock(m_config.loop.gameMinutesPerRealSecond)
    , m_stepper(m_config.loop.fixedStepSeconds)
    , m_detection(m_dials, m_config.detection, &m_bus, &m_occlusion)
    , m_activities(m_config.activity, &m_detection, &m_bus)
    , m_heat(m_clock, &m_detection, m_config.heat, &m_bus)
{
    m_bus.Subscribe("activity_caught", [this](const engine::core::Event& event) {
        OnActivityCaught(event);
    });
}

int SuspicionLoop::Frame(double realDeltaSeconds)
{
    m_stepper.BeginFrame(realDeltaSeconds);

    int steps = 0;
    while (m_stepper.ShouldRunFixedStep())
    {
        Step(m_stepper.FixedDeltaSeconds());
        m_stepper.ConsumeFixedStep();
        ++steps;
    }
    return steps;
}

void SuspicionLoop::Step(double realSeconds)
{
    if (realSeconds <= 0.0)
    {
        return;
    }

    const double gameHours = m_clock.AdvanceReal(realSeconds);
    const float deltaSeconds = static_cast<float>(realSeconds);

    m_detection.Update(deltaSeconds);
    m_activities.Update(deltaSeconds);
    m_bus.DispatchQueued();

    m_heat.Update(gameHours);
    m_bus.DispatchQueued();
}

void SuspicionLoop::OnActivityCaught(const engine::core::Event& event)
{
    const std::string ownerId = event.Arg(1);
    const std::string riskTag = event.Arg(2);
    if (ownerId != m_heat.GetActorId())
    {
        return;
    }

    const ActivityProfile profile = m_detection.GetActivityProfile(riskTag);
    const float perDetection = profile.isLegal ? m_config.loop.heatPerLegalDetection : m_config.loop.heatPerIllegalDetection;
    const float amount = perDetection * event.value;
    if (amount <= 0.0F)
    {
        return;
    }

    std::cout << "[Loop] Detection of '" << riskTag << "' adds " << amount << " heat\n";
    m_heat.AddHeat(amount, profile.isLegal ? std::string{heat_sources::kCaughtOnJob} : riskTag);
}
} // namespace hustle::gameplay
