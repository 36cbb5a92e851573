#ifndef DOCPIPE_CLIENT_LOADER_STATE_HPP
#define DOCPIPE_CLIENT_LOADER_STATE_HPP

#include <ostream>
#include <string>

namespace docpipe {
namespace client {

/**
 * LoaderState tracks where a progressive loader is for its active entry.
 * Implements a state machine that enforces valid transitions and rejects invalid ones.
 */
class LoaderState {
public:
    /**
     * Loader states:
     * EMPTY    - No entry selected, or the selection was just reset
     * LOADING  - A chunk fetch is outstanding
     * LOADED   - Some chunks applied, more available, nothing in flight
     * COMPLETE - Every chunk applied
     * FAILED   - The last fetch failed; only an explicit retry leaves this state
     */
    enum class State {
        EMPTY,
        LOADING,
        LOADED,
        COMPLETE,
        FAILED
    };

    LoaderState() : current_state_(State::EMPTY) {}

    State get_state() const { return current_state_; }

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

    // Check if a transition is valid. Every state may go back to EMPTY.
    static bool is_valid_transition(State from, State to) {
        if (to == State::EMPTY) {
            return true;
        }

        switch (from) {
            case State::EMPTY:
                return to == State::LOADING ||
                       to == State::COMPLETE;

            case State::LOADING:
                return to == State::LOADING ||
                       to == State::LOADED ||
                       to == State::COMPLETE ||
                       to == State::FAILED;

            case State::LOADED:
                return to == State::LOADING ||
                       to == State::LOADED ||
                       to == State::COMPLETE ||
                       to == State::FAILED;

            case State::COMPLETE:
                return false;

            case State::FAILED:
                return to == State::LOADING;
        }
        return false;
    }

    // Convert state to string for logging
    static std::string state_to_string(State state) {
        switch (state) {
            case State::EMPTY:    return "EMPTY";
            case State::LOADING:  return "LOADING";
            case State::LOADED:   return "LOADED";
            case State::COMPLETE: return "COMPLETE";
            case State::FAILED:   return "FAILED";
            default:              return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for LoaderState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const LoaderState::State& state) {
    os << LoaderState::state_to_string(state);
    return os;
}

} // namespace client
} // namespace docpipe

#endif // DOCPIPE_CLIENT_LOADER_STATE_HPP
