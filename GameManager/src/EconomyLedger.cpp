#include "EconomyLedger.h"

#include <stdexcept>

using namespace Citadel;

EconomyLedger::EconomyLedger(double startingBalance)
    : balances_{ startingBalance, startingBalance }
{}

bool EconomyLedger::canAfford(Team team, double amount) const {
    return getBalance(team) >= amount;
}

bool EconomyLedger::debit(Team team, double amount) {
    if (amount < 0) throw std::invalid_argument("EconomyLedger::debit: negative amount");
    if (!canAfford(team, amount)) return false;
    balances_[teamIndex(team)] -= amount;
    return true;
}

void EconomyLedger::credit(Team team, double amount) {
    if (amount < 0) throw std::invalid_argument("EconomyLedger::credit: negative amount");
    balances_[teamIndex(team)] += amount;
}
