#include "ferry/transfer/state_machine.hpp"

#include <algorithm>
#include <map>
#include <vector>

namespace ferry::transfer {
namespace {

bool is_progressive(TransferState current, TransferState target) {
    static const std::map<TransferState, std::vector<TransferState>> transitions{
        {TransferState::Pending, {TransferState::Negotiating}},
        {TransferState::Negotiating, {TransferState::Transferring}},
        {TransferState::Transferring, {TransferState::Paused, TransferState::Completed}},
        {TransferState::Paused, {TransferState::Transferring}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

SessionStateMachine::SessionStateMachine(core::Clock clock)
    : clock_(std::move(clock)), last_transition_(clock_()) {}

bool SessionStateMachine::is_allowed(TransferState from, TransferState to) noexcept {
    if (is_terminal(from)) {
        return false;
    }
    if (to == TransferState::Failed || to == TransferState::Cancelled) {
        return true;
    }
    return is_progressive(from, to);
}

ferry::Result<void> SessionStateMachine::transition_to(TransferState next) {
    if (state_ == next) {
        return ferry::Ok();
    }
    if (!is_allowed(state_, next)) {
        return ferry::Err<void>(ferry::Error::state(std::string("illegal transition ") + to_string(state_) +
                                                    " -> " + to_string(next)));
    }

    state_ = next;
    last_transition_ = clock_();
    return ferry::Ok();
}

ferry::Result<void> SessionStateMachine::fail(Error error) {
    if (state_ == TransferState::Failed) {
        return ferry::Ok();
    }
    if (auto moved = transition_to(TransferState::Failed); moved.is_error()) {
        return moved;
    }
    error_ = std::move(error);
    return ferry::Ok();
}

} // namespace ferry::transfer
