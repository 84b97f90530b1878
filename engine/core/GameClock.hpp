#pragma once

namespace engine::core
{
/// Monotonic in-game calendar.
/// Time is accumulated as game minutes in a double so variable frame deltas
/// sum deterministically; nothing here reads the wall clock.
class GameClock
{
public:
    static constexpr double kMinutesPerHour = 60.0;
    static constexpr double kMinutesPerDay = 24.0 * 60.0;

    explicit GameClock(double gameMinutesPerRealSecond = 1.0);

    void SetTimeScale(double gameMinutesPerRealSecond);
    [[nodiscard]] double TimeScale() const { return m_timeScale; }

    /// Moves the calendar forward. Negative values are ignored.
    void Advance(double gameMinutes);

    /// Converts real seconds through the time scale and advances.
    /// @return Game hours that elapsed.
    double AdvanceReal(double realSeconds);

    void Reset(double startMinutes = 0.0);

    [[nodiscard]] double NowMinutes() const { return m_nowMinutes; }
    [[nodiscard]] double NowHours() const { return m_nowMinutes / kMinutesPerHour; }
    [[nodiscard]] double NowDays() const { return m_nowMinutes / kMinutesPerDay; }
    [[nodiscard]] int DayIndex() const;

private:
    double m_nowMinutes = 0.0;
    double m_timeScale = 1.0;
};

/// Fixed-step accumulator for the simulation driver (real seconds).
class FixedStepper
{
public:
    explicit FixedStepper(double fixedDeltaSeconds = 0.2);

    void SetFixedDeltaSeconds(double fixedDeltaSeconds);

    void BeginFrame(double deltaSeconds);
    [[nodiscard]] bool ShouldRunFixedStep() const;
    void ConsumeFixedStep();

    [[nodiscard]] double FixedDeltaSeconds() const { return m_fixedDeltaSeconds; }
    [[nodiscard]] double TotalSeconds() const { return m_totalSeconds; }
    [[nodiscard]] unsigned long long StepIndex() const { return m_stepIndex; }

private:
    double m_fixedDeltaSeconds;
    double m_totalSeconds;
    double m_accumulator;
    unsigned long long m_stepIndex;
};
} // namespace engine::core
