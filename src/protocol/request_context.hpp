#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "protocol/origin.hpp"

namespace toolgate::protocol {

    // Request-scoped values threaded explicitly through every tool call.
    // A default-constructed context is a user-origin call with no deadline.
    struct RequestContext {
        using Clock = std::chrono::steady_clock;

        Origin origin = Origin::User;
        std::string session_id;
        std::shared_ptr<std::atomic_bool> cancel_token;
        std::optional<Clock::time_point> deadline;

        bool cancelled() const {
            return cancel_token && cancel_token->load();
        }

        bool expired() const {
            return deadline.has_value() && Clock::now() >= deadline.value();
        }

        // True once the caller no longer wants the result.
        bool done() const { return cancelled() || expired(); }

        RequestContext with_origin(const Origin next) const {
            RequestContext copy = *this;
            copy.origin = next;
            return copy;
        }

        RequestContext with_timeout(const std::chrono::milliseconds timeout) const {
            RequestContext copy = *this;
            const auto candidate = Clock::now() + timeout;
            if (!copy.deadline.has_value() || candidate < copy.deadline.value()) {
                copy.deadline = candidate;
            }
            return copy;
        }

        // Milliseconds left before the deadline, or nullopt when unbounded.
        std::optional<std::int64_t> remaining_ms() const {
            if (!deadline.has_value()) {
                return std::nullopt;
            }
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  deadline.value() - Clock::now())
                                  .count();
            return left > 0 ? left : 0;
        }
    };

    inline RequestContext make_context(const Origin origin,
                                       std::string session_id = "") {
        RequestContext ctx;
        ctx.origin = origin;
        ctx.session_id = std::move(session_id);
        ctx.cancel_token = std::make_shared<std::atomic_bool>(false);
        return ctx;
    }

} // namespace toolgate::protocol
