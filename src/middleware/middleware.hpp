#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>
#include "protocol/event_contract.hpp"
#include "protocol/run_agent_input.hpp"

namespace agui::middleware {

// An agent, or an agent already wrapped by middleware.
using EventProducer = std::function<protocol::EventStream(const protocol::RunAgentInput&)>;

class Middleware {
public:
    virtual ~Middleware() = default;

    // May rewrite the input, call next zero or more times, and filter or extend
    // what comes back.
    virtual protocol::EventStream run(const protocol::RunAgentInput& input,
                                      const EventProducer& next) = 0;
};

class FunctionMiddleware : public Middleware {
public:
    using Fn = std::function<protocol::EventStream(const protocol::RunAgentInput&,
                                                   const EventProducer&)>;

    explicit FunctionMiddleware(Fn fn);

    protocol::EventStream run(const protocol::RunAgentInput& input,
                              const EventProducer& next) override;

private:
    Fn fn_;
};

class MiddlewareChain {
public:
    void use(std::shared_ptr<Middleware> middleware);
    void use(FunctionMiddleware::Fn fn);

    std::size_t size() const { return middlewares_.size(); }

    // The first registered middleware is the outermost: it sees the caller's
    // input first and the agent's events last.
    EventProducer wrap(EventProducer agent) const;

private:
    std::vector<std::shared_ptr<Middleware>> middlewares_;
};

}  // namespace agui::middleware
