#pragma once

#include "ferry/core/clock.hpp"
#include "ferry/core/result.hpp"
#include "ferry/transfer/types.hpp"

#include <optional>

namespace ferry::transfer {

/**
 * @brief Legal lifecycle of a sending session
 *
 * Pending -> Negotiating -> Transferring <-> Paused -> Completed/Failed/Cancelled.
 * Cancelled and Failed are reachable from every non-terminal state;
 * terminal states are final. Not thread-safe; the owning session locks.
 */
class SessionStateMachine {
public:
    explicit SessionStateMachine(core::Clock clock = core::system_clock());

    [[nodiscard]] TransferState state() const noexcept { return state_; }
    [[nodiscard]] const std::optional<Error>& error() const noexcept { return error_; }
    [[nodiscard]] core::TimePoint last_transition() const noexcept { return last_transition_; }

    /// State error for an illegal transition; a no-op when already in `next`.
    ferry::Result<void> transition_to(TransferState next);

    /// Moves to Failed and records the cause.
    ferry::Result<void> fail(Error error);

    static bool is_allowed(TransferState from, TransferState to) noexcept;

private:
    core::Clock clock_;
    TransferState state_ = TransferState::Pending;
    std::optional<Error> error_;
    core::TimePoint last_transition_;
};

} // namespace ferry::transfer
