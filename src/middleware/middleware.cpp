#include "middleware/middleware.hpp"

#include <utility>

namespace agui::middleware {

FunctionMiddleware::FunctionMiddleware(Fn fn) : fn_(std::move(fn)) {}

protocol::EventStream FunctionMiddleware::run(const protocol::RunAgentInput& input,
                                              const EventProducer& next) {
    if (!fn_) {
        return next(input);
    }
    return fn_(input, next);
}

void MiddlewareChain::use(std::shared_ptr<Middleware> middleware) {
    if (middleware != nullptr) {
        middlewares_.push_back(std::move(middleware));
    }
}

void MiddlewareChain::use(FunctionMiddleware::Fn fn) {
    middlewares_.push_back(std::make_shared<FunctionMiddleware>(std::move(fn)));
}

EventProducer MiddlewareChain::wrap(EventProducer agent) const {
    EventProducer next = std::move(agent);
    for (auto it = middlewares_.rbegin(); it != middlewares_.rend(); ++it) {
        std::shared_ptr<Middleware> middleware = *it;
        next = [middleware, inner = std::move(next)](const protocol::RunAgentInput& input) {
            return middleware->run(input, inner);
        };
    }
    return next;
}

}  // namespace agui::middleware
