#include "AgentInvoker.h"

#include <chrono>
#include <exception>
#include <future>
#include <thread>

namespace Citadel {

InvocationOutcome invokeWithBudget(std::shared_ptr<Agent> agent,
                                   std::shared_ptr<TeamGateway> gateway,
                                   double budgetSeconds) {
    InvocationOutcome outcome;

    auto task = std::make_shared<std::packaged_task<void()>>(
        [agent, gateway] { agent->playTurn(*gateway); });
    std::future<void> done = task->get_future();

    const auto start = std::chrono::steady_clock::now();
    std::thread worker([task] { (*task)(); });

    const auto budget = std::chrono::duration<double>(budgetSeconds > 0 ? budgetSeconds : 0.0);
    const std::future_status status = done.wait_for(budget);
    gateway->revoke();
    outcome.elapsedSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (status != std::future_status::ready) {
        worker.detach();
        outcome.timedOut = true;
        return outcome;
    }

    worker.join();
    try {
        done.get();
    } catch (const std::exception& e) {
        outcome.fault = e.what();
        return outcome;
    } catch (...) {
        outcome.fault = "non-standard exception";
        return outcome;
    }

    if (outcome.elapsedSeconds >= budgetSeconds) {
        outcome.timedOut = true;
        return outcome;
    }
    outcome.completed = true;
    return outcome;
}

} // namespace Citadel
