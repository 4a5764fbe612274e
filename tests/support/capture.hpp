#pragma once

#include "gateway/block_gateway.hpp"

#include <memory>
#include <optional>

namespace arbor::testing {

/**
 * Records the outcome handed to an engine continuation.
 */
template<typename T>
class Capture {
public:
    [[nodiscard]] gateway::Callback<T> callback() {
        return [state = state_](Result<T> result) {
            ++state->calls;
            state->result.emplace(std::move(result));
        };
    }

    [[nodiscard]] bool done() const { return state_->result.has_value(); }
    [[nodiscard]] int calls() const { return state_->calls; }
    [[nodiscard]] bool ok() const { return done() && state_->result->is_ok(); }
    [[nodiscard]] bool failed() const { return done() && state_->result->is_err(); }
    [[nodiscard]] const Result<T>& result() const { return *state_->result; }
    [[nodiscard]] const Error& error() const { return state_->result->unwrap_err(); }

private:
    struct State {
        std::optional<Result<T>> result;
        int calls = 0;
    };
    std::shared_ptr<State> state_ = std::make_shared<State>();
};

} // namespace arbor::testing
