#pragma once

#include <Archetypes.h>
#include <GameTypes.h>

namespace Citadel {

/*
  A Unit holds its owner, archetype, grid position, live stats and this
  turn's remaining action and movement budgets. Live damage/defense start
  at the archetype values and may be raised by exploration.
*/
class Unit {
public:
    Unit(EntityId id, Team team, UnitKind kind, int x, int y);

    EntityId getId()     const { return id_; }
    Team     getTeam()   const { return team_; }
    UnitKind getKind()   const { return kind_; }
    int      getX()      const { return x_; }
    int      getY()      const { return y_; }
    int      getHealth() const { return health_; }
    int      getDamage() const { return damage_; }
    int      getDefense()const { return defense_; }
    int      getAttackRange() const { return attackRange_; }
    int      getDamageRange() const { return damageRange_; }
    int      getActionsRemaining()  const { return actionsRemaining_; }
    int      getMovementRemaining() const { return movementRemaining_; }
    int      getLevel()  const { return level_; }

    const UnitArchetype& archetype() const { return unitArchetype(kind_); }

    // Called once per turn during upkeep.
    void resetTurnAllowance();

    bool hasActions() const { return actionsRemaining_ > 0; }
    void consumeAction();

    void moveTo(int x, int y, int cost);

    // Returns health left; <= 0 means dead.
    int  takeDamage(int amount);
    // Clamped to the archetype maximum; never lowers health.
    void heal(int amount);
    void setHealth(int health) { health_ = health; }
    void addDamage(int bonus)  { damage_ += bonus; }
    void addDefense(int bonus) { defense_ += bonus; }

    UnitInfo info() const;

private:
    EntityId id_;
    Team     team_;
    UnitKind kind_;
    int      x_, y_;
    int      health_;
    int      damage_;
    int      defense_;
    int      attackRange_;
    int      damageRange_;
    int      actionsRemaining_;
    int      movementRemaining_;
    int      level_;
};

/// A Building never moves. Everything else mirrors Unit.
class Building {
public:
    Building(EntityId id, Team team, BuildingKind kind, int x, int y);

    EntityId     getId()     const { return id_; }
    Team         getTeam()   const { return team_; }
    BuildingKind getKind()   const { return kind_; }
    int          getX()      const { return x_; }
    int          getY()      const { return y_; }
    int          getHealth() const { return health_; }
    int          getDamage() const { return damage_; }
    int          getDefense()const { return defense_; }
    int          getAttackRange() const { return attackRange_; }
    int          getDamageRange() const { return damageRange_; }
    int          getActionsRemaining() const { return actionsRemaining_; }
    int          getLevel()  const { return level_; }

    const BuildingArchetype& archetype() const { return buildingArchetype(kind_); }

    void resetTurnAllowance();
    bool hasActions() const { return actionsRemaining_ > 0; }
    void consumeAction();
    int  takeDamage(int amount);

    BuildingInfo info() const;

private:
    EntityId     id_;
    Team         team_;
    BuildingKind kind_;
    int          x_, y_;
    int          health_;
    int          damage_;
    int          defense_;
    int          attackRange_;
    int          damageRange_;
    int          actionsRemaining_;
    int          level_;
};

} // namespace Citadel
