#pragma once

#include <GameTypes.h>

#include <array>

namespace Citadel {

/// One balance per team. Fractional because sell refunds are discounted.
class EconomyLedger {
public:
    explicit EconomyLedger(double startingBalance);

    double getBalance(Team team) const { return balances_[teamIndex(team)]; }
    bool   canAfford(Team team, double amount) const;

    /// Fails without touching the balance when funds are short.
    bool debit(Team team, double amount);
    void credit(Team team, double amount);

private:
    std::array<double, 2> balances_;
};

} // namespace Citadel
