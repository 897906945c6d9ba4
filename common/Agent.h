#pragma once

#include "ActionGateway.h"
#include "GameTypes.h"

#include <functional>
#include <memory>

/**
 * Every agent plugin implements this interface. playTurn() is called once
 * per turn with a gateway bound to the agent's own team and must return
 * within the team's remaining time pool.
 */
class Agent {
public:
    virtual ~Agent() {}
    virtual void playTurn(ActionGateway& gateway) = 0;
};

/// Builds the agent for `team`. Throwing here counts as a failed initialization.
using AgentFactory =
    std::function<std::unique_ptr<Agent>(Team team, const MapSnapshot& map)>;
