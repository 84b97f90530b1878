#pragma once

#include <algorithm>
#include <string>

#include "hustle/gameplay/Collaborators.hpp"

namespace hustle::testing
{
class FakeEconomy final : public gameplay::EconomyLink
{
public:
    float GetLegitimacyRatio(const std::string& /*actorId*/) const override { return legitimacy; }
    float GetBalance(const std::string& /*actorId*/) const override { return balance; }

    void FreezeFunds(const std::string& /*actorId*/, float amount) override
    {
        frozen += amount;
        ++freezeCalls;
    }

    void UnfreezeFunds(const std::string& /*actorId*/, float amount) override
    {
        frozen = std::max(0.0F, frozen - amount);
        ++unfreezeCalls;
    }

    void ChargeFine(const std::string& /*actorId*/, float amount, const std::string& /*reason*/) override
    {
        balance -= amount;
        totalFines += amount;
    }

    float legitimacy = 1.0F;
    float balance = 1000.0F;
    float frozen = 0.0F;
    float totalFines = 0.0F;
    int freezeCalls = 0;
    int unfreezeCalls = 0;
};

class FakeEvidence final : public gameplay::EvidenceLink
{
public:
    bool HasIncriminatingEvidence(const std::string& /*actorId*/) const override { return hasEvidence; }

    bool hasEvidence = false;
};
} // namespace hustle::testing
