#pragma once

#include <string>

namespace hustle::gameplay
{
/// Read/write view of the money ledger that audits need.
/// The ledger itself lives outside the suspicion loop.
class EconomyLink
{
public:
    virtual ~EconomyLink() = default;

    /// Share of income from legitimate sources, 0..1.
    [[nodiscard]] virtual float GetLegitimacyRatio(const std::string& actorId) const = 0;
    [[nodiscard]] virtual float GetBalance(const std::string& actorId) const = 0;

    virtual void FreezeFunds(const std::string& actorId, float amount) = 0;
    virtual void UnfreezeFunds(const std::string& actorId, float amount) = 0;
    virtual void ChargeFine(const std::string& actorId, float amount, const std::string& reason) = 0;
};

/// Answers whether a raid would turn up anything.
class EvidenceLink
{
public:
    virtual ~EvidenceLink() = default;

    [[nodiscard]] virtual bool HasIncriminatingEvidence(const std::string& actorId) const = 0;
};
} // namespace hustle::gameplay
