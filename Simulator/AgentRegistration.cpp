#include "AgentRegistrar.h"
#include "AgentRegistration.h"

AgentRegistration::AgentRegistration(AgentFactory factory) {
    auto& registrar = AgentRegistrar::get();
    registrar.addAgentFactoryToLastEntry(std::move(factory));
}
