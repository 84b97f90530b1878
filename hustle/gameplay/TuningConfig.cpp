#include "hustle/gameplay/TuningConfig.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace hustle::gameplay
{
namespace
{
constexpr int kAssetVersion = 1;

void ReadActivity(const nlohmann::json& json, ActivityTuning& t)
{
    t.initialPerformance = json.value("initial_performance", t.initialPerformance);
    t.defaultPerformanceSample = json.value("default_performance_sample", t.defaultPerformanceSample);
    t.performanceBlendWeight = json.value("performance_blend_weight", t.performanceBlendWeight);
    t.detectionPenalty = json.value("detection_penalty", t.detectionPenalty);
    t.defaultAttention = json.value("default_attention", t.defaultAttention);
    t.emptyTagAttention = json.value("empty_tag_attention", t.emptyTagAttention);
    t.defaultOwnerId = json.value("default_owner_id", t.defaultOwnerId);
    t.maxFinishedResults = json.value("max_finished_results", t.maxFinishedResults);
    t.verboseLogging = json.value("verbose_logging", t.verboseLogging);

    if (json.contains("attention_keywords"))
    {
        t.attentionKeywords.clear();
        for (const auto& entry : json["attention_keywords"])
        {
            t.attentionKeywords.emplace_back(entry.value("keyword", ""), entry.value("attention", t.defaultAttention));
        }
    }
    if (json.contains("risk_keywords"))
    {
        t.riskKeywords = json["risk_keywords"].get<std::vector<std::string>>();
    }
}

nlohmann::json WriteActivity(const ActivityTuning& t)
{
    nlohmann::json json;
    json["initial_performance"] = t.initialPerformance;
    json["default_performance_sample"] = t.defaultPerformanceSample;
    json["performance_blend_weight"] = t.performanceBlendWeight;
    json["detection_penalty"] = t.detectionPenalty;
    json["default_attention"] = t.defaultAttention;
    json["empty_tag_attention"] = t.emptyTagAttention;
    json["default_owner_id"] = t.defaultOwnerId;
    json["max_finished_results"] = t.maxFinishedResults;
    json["verbose_logging"] = t.verboseLogging;

    nlohmann::json keywords = nlohmann::json::array();
    for (const auto& [keyword, attention] : t.attentionKeywords)
    {
        keywords.push_back({{"keyword", keyword}, {"attention", attention}});
    }
    json["attention_keywords"] = keywords;
    json["risk_keywords"] = t.riskKeywords;
    return json;
}

ActivityProfile ReadProfile(const nlohmann::json& json, const ActivityProfile& fallback)
{
    ActivityProfile profile;
    profile.isLegal = json.value("legal", fallback.isLegal);
    profile.visualProfile = json.value("visual_profile", fallback.visualProfile);
    return profile;
}

void ReadDetection(const nlohmann::json& json, DetectionTuning& t)
{
    t.distanceEpsilon = json.value("distance_epsilon", t.distanceEpsilon);
    t.patrolJitterFraction = json.value("patrol_jitter_fraction", t.patrolJitterFraction);
    t.minDialMultiplier = json.value("min_dial_multiplier", t.minDialMultiplier);
    t.minVisionRange = json.value("min_vision_range", t.minVisionRange);
    t.defaultPatrolIntervalSeconds = json.value("default_patrol_interval_seconds", t.defaultPatrolIntervalSeconds);
    t.defaultLocation = json.value("default_location", t.defaultLocation);
    t.randomSeed = json.value("random_seed", t.randomSeed);
    t.verboseLogging = json.value("verbose_logging", t.verboseLogging);

    if (json.contains("default_profile"))
    {
        t.defaultProfile = ReadProfile(json["default_profile"], t.defaultProfile);
    }
    if (json.contains("activity_profiles"))
    {
        for (const auto& [tag, profileJson] : json["activity_profiles"].items())
        {
            t.activityProfiles[tag] = ReadProfile(profileJson, t.defaultProfile);
        }
    }
}

nlohmann::json WriteDetection(const DetectionTuning& t)
{
    nlohmann::json json;
    json["distance_epsilon"] = t.distanceEpsilon;
    json["patrol_jitter_fraction"] = t.patrolJitterFraction;
    json["min_dial_multiplier"] = t.minDialMultiplier;
    json["min_vision_range"] = t.minVisionRange;
    json["default_patrol_interval_seconds"] = t.defaultPatrolIntervalSeconds;
    json["default_location"] = t.defaultLocation;
    json["random_seed"] = t.randomSeed;
    json["verbose_logging"] = t.verboseLogging;
    json["default_profile"] = {{"legal", t.defaultProfile.isLegal}, {"visual_profile", t.defaultProfile.visualProfile}};

    nlohmann::json profiles = nlohmann::json::object();
    for (const auto& [tag, profile] : t.activityProfiles)
    {
        profiles[tag] = {{"legal", profile.isLegal}, {"visual_profile", profile.visualProfile}};
    }
    json["activity_profiles"] = profiles;
    return json;
}

void ReadHeat(const nlohmann::json& json, HeatTuning& t)
{
    if (json.contains("thresholds"))
    {
        const auto values = json["thresholds"].get<std::vector<float>>();
        for (std::size_t i = 0; i < t.thresholds.size() && i < values.size(); ++i)
        {
            t.thresholds[i] = values[i];
        }
        // Effects are bound to rank: watch, surveillance, audit, raid.
        if (!std::is_sorted(t.thresholds.begin(), t.thresholds.end()))
        {
            std::cout << "[Tuning] WARNING - Heat thresholds out of order, sorting ascending\n";
            std::sort(t.thresholds.begin(), t.thresholds.end());
        }
    }

    t.baseDecayPerHour = json.value("base_decay_per_hour", t.baseDecayPerHour);
    t.freshDecayMultiplier = json.value("fresh_decay_multiplier", t.freshDecayMultiplier);
    t.normalDecayMultiplier = json.value("normal_decay_multiplier", t.normalDecayMultiplier);
    t.staleDecayMultiplier = json.value("stale_decay_multiplier", t.staleDecayMultiplier);
    t.coldDecayMultiplier = json.value("cold_decay_multiplier", t.coldDecayMultiplier);
    t.freshDays = json.value("fresh_days", t.freshDays);
    t.staleDays = json.value("stale_days", t.staleDays);
    t.coldDays = json.value("cold_days", t.coldDays);

    t.watchPatrolFactor = json.value("watch_patrol_factor", t.watchPatrolFactor);
    t.surveillancePatrolFactor = json.value("surveillance_patrol_factor", t.surveillancePatrolFactor);
    t.surveillanceSensitivityFactor = json.value("surveillance_sensitivity_factor", t.surveillanceSensitivityFactor);
    t.auditLegitimacyThreshold = json.value("audit_legitimacy_threshold", t.auditLegitimacyThreshold);
    t.auditClearLegitimacy = json.value("audit_clear_legitimacy", t.auditClearLegitimacy);
    t.auditFreezeFraction = json.value("audit_freeze_fraction", t.auditFreezeFraction);
    t.auditFineFraction = json.value("audit_fine_fraction", t.auditFineFraction);
    t.auditWindowDays = json.value("audit_window_days", t.auditWindowDays);
    t.raidHeatFactor = json.value("raid_heat_factor", t.raidHeatFactor);
    t.warrantPatrolFactor = json.value("warrant_patrol_factor", t.warrantPatrolFactor);
    t.evidenceChance = json.value("evidence_chance", t.evidenceChance);

    t.largeDepositAmount = json.value("large_deposit_amount", t.largeDepositAmount);
    t.depositHeatPer10k = json.value("deposit_heat_per_10k", t.depositHeatPer10k);
    t.suspiciousIncomeHeat = json.value("suspicious_income_heat", t.suspiciousIncomeHeat);
    t.flashyVanityThreshold = json.value("flashy_vanity_threshold", t.flashyVanityThreshold);
    t.flashyHeatPer100Vanity = json.value("flashy_heat_per_100_vanity", t.flashyHeatPer100Vanity);

    t.actorId = json.value("actor_id", t.actorId);
    t.randomSeed = json.value("random_seed", t.randomSeed);
    t.verboseLogging = json.value("verbose_logging", t.verboseLogging);
}

nlohmann::json WriteHeat(const HeatTuning& t)
{
    nlohmann::json json;
    json["thresholds"] = t.thresholds;
    json["base_decay_per_hour"] = t.baseDecayPerHour;
    json["fresh_decay_multiplier"] = t.freshDecayMultiplier;
    json["normal_decay_multiplier"] = t.normalDecayMultiplier;
    json["stale_decay_multiplier"] = t.staleDecayMultiplier;
    json["cold_decay_multiplier"] = t.coldDecayMultiplier;
    json["fresh_days"] = t.freshDays;
    json["stale_days"] = t.staleDays;
    json["cold_days"] = t.coldDays;
    json["watch_patrol_factor"] = t.watchPatrolFactor;
    json["surveillance_patrol_factor"] = t.surveillancePatrolFactor;
    json["surveillance_sensitivity_factor"] = t.surveillanceSensitivityFactor;
    json["audit_legitimacy_threshold"] = t.auditLegitimacyThreshold;
    json["audit_clear_legitimacy"] = t.auditClearLegitimacy;
    json["audit_freeze_fraction"] = t.auditFreezeFraction;
    json["audit_fine_fraction"] = t.auditFineFraction;
    json["audit_window_days"] = t.auditWindowDays;
    json["raid_heat_factor"] = t.raidHeatFactor;
    json["warrant_patrol_factor"] = t.warrantPatrolFactor;
    json["evidence_chance"] = t.evidenceChance;
    json["large_deposit_amount"] = t.largeDepositAmount;
    json["deposit_heat_per_10k"] = t.depositHeatPer10k;
    json["suspicious_income_heat"] = t.suspiciousIncomeHeat;
    json["flashy_vanity_threshold"] = t.flashyVanityThreshold;
    json["flashy_heat_per_100_vanity"] = t.flashyHeatPer100Vanity;
    json["actor_id"] = t.actorId;
    json["random_seed"] = t.randomSeed;
    json["verbose_logging"] = t.verboseLogging;
    return json;
}

void ReadLoop(const nlohmann::json& json, LoopTuning& t)
{
    t.fixedStepSeconds = json.value("fixed_step_seconds", t.fixedStepSeconds);
    t.gameMinutesPerRealSecond = json.value("game_minutes_per_real_second", t.gameMinutesPerRealSecond);
    t.heatPerIllegalDetection = json.value("heat_per_illegal_detection", t.heatPerIllegalDetection);
    t.heatPerLegalDetection = json.value("heat_per_legal_detection", t.heatPerLegalDetection);
}

nlohmann::json WriteLoop(const LoopTuning& t)
{
    nlohmann::json json;
    json["fixed_step_seconds"] = t.fixedStepSeconds;
    json["game_minutes_per_real_second"] = t.gameMinutesPerRealSecond;
    json["heat_per_illegal_detection"] = t.heatPerIllegalDetection;
    json["heat_per_legal_detection"] = t.heatPerLegalDetection;
    return json;
}
} // namespace

bool LoadTuningFromJson(const std::string& jsonPath, TuningConfig& config)
{
    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cout << "[Tuning] WARNING - Could not open tuning file '" << jsonPath << "'\n";
        return false;
    }

    try
    {
        nlohmann::json root;
        file >> root;

        const int assetVersion = root.value("asset_version", 0);
        if (assetVersion != kAssetVersion)
        {
            std::cout << "[Tuning] WARNING - Unexpected asset version " << assetVersion << ", expected " << kAssetVersion << "\n";
        }

        // Parse into a copy so a malformed section leaves the caller's config intact.
        TuningConfig parsed = config;
        if (root.contains("activity"))
        {
            ReadActivity(root["activity"], parsed.activity);
        }
        if (root.contains("detection"))
        {
            ReadDetection(root["detection"], parsed.detection);
        }
        if (root.contains("heat"))
        {
            ReadHeat(root["heat"], parsed.heat);
        }
        if (root.contains("loop"))
        {
            ReadLoop(root["loop"], parsed.loop);
        }

        config = std::move(parsed);
        std::cout << "[Tuning] Loaded " << jsonPath << " (" << config.detection.activityProfiles.size() << " activity profiles)\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "[Tuning] ERROR - Failed to parse '" << jsonPath << "': " << e.what() << "\n";
        return false;
    }
}

bool SaveTuningToJson(const std::string& jsonPath, const TuningConfig& config)
{
    try
    {
        nlohmann::json root;
        root["asset_version"] = kAssetVersion;
        root["activity"] = WriteActivity(config.activity);
        root["detection"] = WriteDetection(config.detection);
        root["heat"] = WriteHeat(config.heat);
        root["loop"] = WriteLoop(config.loop);

        std::ofstream file(jsonPath);
        if (!file.is_open())
        {
            std::cout << "[Tuning] ERROR - Could not open '" << jsonPath << "' for writing\n";
            return false;
        }

        file << root.dump(2);
        std::cout << "[Tuning] Saved " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "[Tuning] ERROR - Failed to save '" << jsonPath << "': " << e.what() << "\n";
        return false;
    }
}
} // namespace hustle::gameplay
