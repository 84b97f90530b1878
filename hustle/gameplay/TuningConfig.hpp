#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hustle::gameplay
{
/// How conspicuous an activity is and whether it is lawful.
struct ActivityProfile
{
    bool isLegal = true;
    float visualProfile = 0.5F; // 0 = inherently undetectable
};

struct ActivityTuning
{
    float initialPerformance = 50.0F;
    float defaultPerformanceSample = 50.0F;
    float performanceBlendWeight = 0.1F;
    float detectionPenalty = 0.2F; // flat points on the 0-100 scale
    float defaultAttention = 0.5F;
    float emptyTagAttention = 0.4F;
    // First matching keyword wins.
    std::vector<std::pair<std::string, float>> attentionKeywords = {{"stream", 0.8F}, {"work", 0.6F}};
    std::vector<std::string> riskKeywords = {"work"};
    std::string defaultOwnerId = "player";
    std::size_t maxFinishedResults = 64; // oldest dropped when the host does not drain
    bool verboseLogging = false;
};

struct DetectionTuning
{
    float distanceEpsilon = 0.001F;
    float patrolJitterFraction = 0.1F;
    float minDialMultiplier = 0.01F;
    float minVisionRange = 0.01F;
    float defaultPatrolIntervalSeconds = 10.0F;
    std::string defaultLocation = "default_location";
    ActivityProfile defaultProfile;
    std::unordered_map<std::string, ActivityProfile> activityProfiles;
    std::uint32_t randomSeed = 1337U;
    bool verboseLogging = false;
};

struct HeatTuning
{
    std::array<float, 4> thresholds = {30.0F, 50.0F, 70.0F, 90.0F};

    float baseDecayPerHour = 1.0F / 24.0F;
    float freshDecayMultiplier = 0.5F;   // < freshDays since last increase
    float normalDecayMultiplier = 1.0F;  // freshDays .. staleDays
    float staleDecayMultiplier = 2.0F;   // staleDays .. coldDays
    float coldDecayMultiplier = 3.0F;    // > coldDays
    float freshDays = 1.0F;
    float staleDays = 7.0F;
    float coldDays = 30.0F;

    float watchPatrolFactor = 1.2F;
    float surveillancePatrolFactor = 1.5F;
    float surveillanceSensitivityFactor = 1.3F;
    float auditLegitimacyThreshold = 0.6F;
    float auditClearLegitimacy = 0.7F;
    float auditFreezeFraction = 0.3F;
    float auditFineFraction = 0.2F;
    float auditWindowDays = 30.0F;
    float raidHeatFactor = 0.5F;
    float warrantPatrolFactor = 2.0F;
    float evidenceChance = 0.5F;

    float largeDepositAmount = 5000.0F;
    float depositHeatPer10k = 5.0F;
    float suspiciousIncomeHeat = 2.0F;
    float flashyVanityThreshold = 70.0F;
    float flashyHeatPer100Vanity = 10.0F;

    std::string actorId = "player";
    std::uint32_t randomSeed = 7331U;
    bool verboseLogging = false;
};

struct LoopTuning
{
    double fixedStepSeconds = 0.2;
    double gameMinutesPerRealSecond = 1.0;
    float heatPerIllegalDetection = 10.0F; // scaled by detection severity
    float heatPerLegalDetection = 0.0F;
};

struct TuningConfig
{
    ActivityTuning activity;
    DetectionTuning detection;
    HeatTuning heat;
    LoopTuning loop;
};

/// Reads a tuning file over the given defaults. Keys that are absent keep their value.
/// @return False if the file cannot be opened or parsed; config is left untouched then.
bool LoadTuningFromJson(const std::string& jsonPath, TuningConfig& config);
bool SaveTuningToJson(const std::string& jsonPath, const TuningConfig& config);
} // namespace hustle::gameplay
