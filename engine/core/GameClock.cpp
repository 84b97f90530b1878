#include "engine/core/GameClock.hpp"

#include <algorithm>
#include <cmath>

namespace engine::core
{
namespace
{
constexpr double kMaxFrameSeconds = 1.0;
}

GameClock::GameClock(double gameMinutesPerRealSecond)
{
    SetTimeScale(gameMinutesPerRealSecond);
}

void GameClock::SetTimeScale(double gameMinutesPerRealSecond)
{
    m_timeScale = std::max(0.0, gameMinutesPerRealSecond);
}

void GameClock::Advance(double gameMinutes)
{
    if (gameMinutes <= 0.0)
    {
        return;
    }
    m_nowMinutes += gameMinutes;
}

double GameClock::AdvanceReal(double realSeconds)
{
    const double minutes = std::max(0.0, realSeconds) * m_timeScale;
    Advance(minutes);
    return minutes / kMinutesPerHour;
}

void GameClock::Reset(double startMinutes)
{
    m_nowMinutes = std::max(0.0, startMinutes);
}

int GameClock::DayIndex() const
{
    return static_cast<int>(std::floor(NowDays()));
}

FixedStepper::FixedStepper(double fixedDeltaSeconds)
    : m_fixedDeltaSeconds(fixedDeltaSeconds)
    , m_totalSeconds(0.0)
    , m_accumulator(0.0)
    , m_stepIndex(0)
{
    SetFixedDeltaSeconds(fixedDeltaSeconds);
}

void FixedStepper::SetFixedDeltaSeconds(double fixedDeltaSeconds)
{
    m_fixedDeltaSeconds = std::clamp(fixedDeltaSeconds, 1.0 / 240.0, 1.0);
    m_accumulator = std::min(m_accumulator, m_fixedDeltaSeconds * 2.0);
}

void FixedStepper::BeginFrame(double deltaSeconds)
{
    const double clamped = std::clamp(deltaSeconds, 0.0, kMaxFrameSeconds);
    m_totalSeconds += clamped;
    m_accumulator += clamped;
}

bool FixedStepper::ShouldRunFixedStep() const
{
    return m_accumulator >= m_fixedDeltaSeconds;
}

void FixedStepper::ConsumeFixedStep()
{
    m_accumulator -= m_fixedDeltaSeconds;
    if (m_accumulator < 0.0)
    {
        m_accumulator = 0.0;
    }
    ++m_stepIndex;
}
} // namespace engine::core
