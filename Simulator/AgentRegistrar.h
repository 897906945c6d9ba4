// Simulator/AgentRegistrar.h
#pragma once

#include <cstddef>
#include <vector>
#include <string>
#include <functional>
#include <memory>
#include "Agent.h"

/*
  Host-side table of loaded agent plugins. The loader pushes an entry
  named after the .so, dlopen()s it, and the plugin's static
  AgentRegistration fills in the factory of that last entry.
  A library must register exactly one agent: with two, there is no telling
  which one the competition would be scoring.
*/
class AgentRegistrar {
    struct Entry {
        std::string so_name;
        AgentFactory factory;
        std::size_t registrations = 0;

        explicit Entry(const std::string& name)
          : so_name(name)
        {}

        void setFactory(AgentFactory&& f) {
            if (!factory) factory = std::move(f);
            ++registrations;
        }

        const std::string& name() const { return so_name; }

        std::unique_ptr<Agent> create(Team team, const MapSnapshot& map) const {
            return factory(team, map);
        }

        bool hasFactory() const {
            return static_cast<bool>(factory);
        }
    };

    std::vector<Entry> entries;
    static AgentRegistrar registrar;

public:
    static AgentRegistrar& get();

    /// Push a new entry (before you dlopen)
    void createAgentEntry(const std::string& name) {
        entries.emplace_back(name);
    }

    /// Called by AgentRegistration to attach the factory
    void addAgentFactoryToLastEntry(AgentFactory&& f) {
        if (entries.empty()) return;
        entries.back().setFactory(std::move(f));
    }

    struct BadRegistrationException {
        std::string name;
        bool hasName;
        bool hasFactory;
        std::size_t factoryCount;
    };

    /// Throws BadRegistrationException unless the last entry has a name and
    /// exactly one factory
    void validateLastRegistration() {
        if (entries.empty()) {
            throw BadRegistrationException{ .name = "", .hasName = false, .hasFactory = false, .factoryCount = 0 };
        }
        const auto& last = entries.back();
        bool hn = !last.name().empty();
        if (!hn || !last.hasFactory() || last.registrations != 1) {
            throw BadRegistrationException{
                .name         = last.name(),
                .hasName      = hn,
                .hasFactory   = last.hasFactory(),
                .factoryCount = last.registrations
            };
        }
    }

    /// Roll back a failed registration
    void removeLast() {
        if (!entries.empty()) entries.pop_back();
    }

    auto begin() const { return entries.begin(); }
    auto end()   const { return entries.end();   }
    const Entry& at(std::size_t i) const { return entries.at(i); }

    std::size_t count() const { return entries.size(); }

    void clear() { entries.clear(); }
};
