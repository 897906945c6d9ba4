#pragma once

#include "Agent.h"

#include <memory>

// Defined by the host executable; a plugin only declares a static instance.
struct AgentRegistration {
    AgentRegistration(AgentFactory);
};

#define REGISTER_CITADEL_AGENT(class_name)                        \
    static AgentRegistration register_me_##class_name(            \
        [](Team team, const MapSnapshot& map) {                   \
            return std::make_unique<class_name>(team, map);       \
        })
