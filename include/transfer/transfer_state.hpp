#ifndef FTECHO_TRANSFER_STATE_HPP
#define FTECHO_TRANSFER_STATE_HPP

#include <ostream>
#include <string>

namespace ftecho {
namespace transfer {

/**
 * TransferState tracks where one operation is inside its frame exchange.
 * Every operation starts and ends in IDLE; any state may fall back to IDLE
 * when the operation fails.
 *
 * LIST:        IDLE -> RESPONDING -> IDLE
 * GET:         IDLE -> RESOLVING_FILE -> STREAMING_OUT -> FINALIZING -> IDLE
 * PUT:         IDLE -> AWAITING_READY -> RECEIVING_DATA -> VERIFYING -> COMMITTED -> IDLE
 * QUIT:        IDLE -> CLOSING
 */
class TransferState {
public:
    enum class State {
        IDLE,
        RESPONDING,
        RESOLVING_FILE,
        STREAMING_OUT,
        FINALIZING,
        AWAITING_READY,
        RECEIVING_DATA,
        VERIFYING,
        COMMITTED,
        CLOSING
    };

    TransferState() : current_state_(State::IDLE) {}

    State get_state() const { return current_state_; }

    bool is_idle() const { return current_state_ == State::IDLE; }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    // Abandons the current operation
    void reset() { current_state_ = State::IDLE; }

    static bool is_valid_transition(State from, State to) {
        if (to == State::IDLE) {
            return from != State::CLOSING;
        }
        switch (from) {
            case State::IDLE:
                return to == State::RESPONDING ||
                       to == State::RESOLVING_FILE ||
                       to == State::AWAITING_READY ||
                       to == State::CLOSING;

            case State::RESOLVING_FILE:
                return to == State::STREAMING_OUT;

            case State::STREAMING_OUT:
                return to == State::FINALIZING;

            case State::AWAITING_READY:
                return to == State::RECEIVING_DATA;

            case State::RECEIVING_DATA:
                return to == State::VERIFYING;

            case State::VERIFYING:
                return to == State::COMMITTED;

            case State::RESPONDING:
            case State::FINALIZING:
            case State::COMMITTED:
            case State::CLOSING:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::IDLE:           return "IDLE";
            case State::RESPONDING:     return "RESPONDING";
            case State::RESOLVING_FILE: return "RESOLVING_FILE";
            case State::STREAMING_OUT:  return "STREAMING_OUT";
            case State::FINALIZING:     return "FINALIZING";
            case State::AWAITING_READY: return "AWAITING_READY";
            case State::RECEIVING_DATA: return "RECEIVING_DATA";
            case State::VERIFYING:      return "VERIFYING";
            case State::COMMITTED:      return "COMMITTED";
            case State::CLOSING:        return "CLOSING";
            default:                    return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

inline std::ostream& operator<<(std::ostream& os, const TransferState::State& state) {
    os << TransferState::state_to_string(state);
    return os;
}

} // namespace transfer
} // namespace ftecho

#endif // FTECHO_TRANSFER_STATE_HPP
