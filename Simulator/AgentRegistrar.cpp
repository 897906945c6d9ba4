#include "AgentRegistrar.h"

AgentRegistrar AgentRegistrar::registrar;

AgentRegistrar& AgentRegistrar::get() {
    return registrar;
}
