#include "Entity.h"

#include <algorithm>

using namespace Citadel;

// ---------------- Unit ----------------

// New units cannot act on the turn they appear.
Unit::Unit(EntityId id, Team team, UnitKind kind, int x, int y)
    : id_(id),
      team_(team),
      kind_(kind),
      x_(x),
      y_(y),
      health_(unitArchetype(kind).health),
      damage_(unitArchetype(kind).damage),
      defense_(unitArchetype(kind).defense),
      attackRange_(unitArchetype(kind).attackRange),
      damageRange_(unitArchetype(kind).damageRange),
      actionsRemaining_(0),
      movementRemaining_(0),
      level_(1)
{}

void Unit::resetTurnAllowance() {
    actionsRemaining_  = archetype().actionsPerTurn;
    movementRemaining_ = archetype().moveRange;
}

void Unit::consumeAction() {
    if (actionsRemaining_ > 0) --actionsRemaining_;
}

void Unit::moveTo(int x, int y, int cost) {
    x_ = x;
    y_ = y;
    movementRemaining_ -= cost;
}

int Unit::takeDamage(int amount) {
    health_ -= amount;
    return health_;
}

void Unit::heal(int amount) {
    const int maxHealth = archetype().health;
    if (health_ >= maxHealth) return;
    health_ = std::min(maxHealth, health_ + amount);
}

UnitInfo Unit::info() const {
    return UnitInfo{
        .id                = id_,
        .team              = team_,
        .kind              = kind_,
        .x                 = x_,
        .y                 = y_,
        .health            = health_,
        .damage            = damage_,
        .defense           = defense_,
        .attackRange       = attackRange_,
        .damageRange       = damageRange_,
        .actionsRemaining  = actionsRemaining_,
        .movementRemaining = movementRemaining_,
        .level             = level_
    };
}

// ---------------- Building ----------------

Building::Building(EntityId id, Team team, BuildingKind kind, int x, int y)
    : id_(id),
      team_(team),
      kind_(kind),
      x_(x),
      y_(y),
      health_(buildingArchetype(kind).health),
      damage_(buildingArchetype(kind).damage),
      defense_(buildingArchetype(kind).defense),
      attackRange_(buildingArchetype(kind).attackRange),
      damageRange_(buildingArchetype(kind).damageRange),
      actionsRemaining_(0),
      level_(1)
{}

void Building::resetTurnAllowance() {
    actionsRemaining_ = archetype().actionsPerTurn;
}

void Building::consumeAction() {
    if (actionsRemaining_ > 0) --actionsRemaining_;
}

int Building::takeDamage(int amount) {
    health_ -= amount;
    return health_;
}

BuildingInfo Building::info() const {
    return BuildingInfo{
        .id               = id_,
        .team             = team_,
        .kind             = kind_,
        .x                = x_,
        .y                = y_,
        .health           = health_,
        .damage           = damage_,
        .defense          = defense_,
        .attackRange      = attackRange_,
        .damageRange      = damageRange_,
        .actionsRemaining = actionsRemaining_,
        .level            = level_
    };
}
