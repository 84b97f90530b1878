#pragma once

#include <string>

#include "engine/core/EventBus.hpp"
#include "engine/core/GameClock.hpp"
#include "engine/physics/OcclusionWorld.hpp"
#include "hustle/gameplay/ActivitySystem.hpp"
#include "hustle/gameplay/DetectionSystem.hpp"
#include "hustle/gameplay/HeatSystem.hpp"
#include "hustle/gameplay/TuningConfig.hpp"

namespace hustle::gameplay
{
/// Owns and wires the activity, detection and heat systems.
///
/// Each fixed step runs in this order:
///   clock -> patrols -> activities (with detection queries) -> dispatch
///   -> heat decay/deadlines -> dispatch
/// so a detection made during a step adds heat within that same step.
class SuspicionLoop
{
public:
    explicit SuspicionLoop(TuningConfig config = {});

    SuspicionLoop(const SuspicionLoop&) = delete;
    SuspicionLoop& operator=(const SuspicionLoop&) = delete;

    /// Feeds real frame time and runs as many fixed steps as it covers.
    /// @return Number of fixed steps run.
    int Frame(double realDeltaSeconds);

    /// Runs exactly one simulation step of the given real duration.
    void Step(double realSeconds);

    [[nodiscard]] const TuningConfig& Config() const { return m_config; }
    [[nodiscard]] engine::core::GameClock& Clock() { return m_clock; }
    [[nodiscard]] engine::core::EventBus& Bus() { return m_bus; }
    [[nodiscard]] engine::physics::OcclusionWorld& Occlusion() { return m_occlusion; }
    [[nodiscard]] const DetectionDials& Dials() const { return m_dials; }
    [[nodiscard]] DetectionSystem& Detection() { return m_detection; }
    [[nodiscard]] ActivitySystem& Activities() { return m_activities; }
    [[nodiscard]] HeatSystem& Heat() { return m_heat; }

private:
    void OnActivityCaught(const engine::core::Event& event);

    TuningConfig m_config;
    engine::core::GameClock m_clock;
    engine::core::FixedStepper m_stepper;
    engine::core::EventBus m_bus;
    engine::physics::OcclusionWorld m_occlusion;
    DetectionDials m_dials;
    DetectionSystem m_detection;
    ActivitySystem m_activities;
    HeatSystem m_heat;
};
} // namespace hustle::gameplay
