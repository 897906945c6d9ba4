#pragma once

#include <Agent.h>
#include "TeamGateway.h"

#include <memory>
#include <string>

namespace Citadel {

struct InvocationOutcome {
    bool        completed = false;   // returned cleanly inside the budget
    bool        timedOut  = false;
    double      elapsedSeconds = 0.0;
    std::string fault;               // exception text when the agent threw
};

/*
  Runs agent->playTurn(*gateway) on its own thread and waits at most
  `budgetSeconds`. The gateway is revoked as soon as the wait ends, so an
  agent that overruns can no longer touch the world. Such a thread is
  detached, not killed; the shared_ptrs it captured keep the agent, the
  gateway and the world alive until it finishes on its own.
*/
InvocationOutcome invokeWithBudget(std::shared_ptr<Agent> agent,
                                   std::shared_ptr<TeamGateway> gateway,
                                   double budgetSeconds);

} // namespace Citadel
