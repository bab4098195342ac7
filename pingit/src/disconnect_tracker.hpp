#pragma once
#include "types.hpp"
#include <optional>
#include <string>

// Outcome of feeding one result into the tracker.
struct Transition {
    enum class Effect {
        None,      // no disconnect activity
        Opened,    // UP -> DOWN, a new event was opened
        Extended,  // DOWN -> DOWN, the open event counted another failure
        Closed     // DOWN -> UP, the open event was closed
    };

    HealthState from = HealthState::Unknown;
    HealthState to = HealthState::Unknown;
    Effect effect = Effect::None;
    // The affected event as it stands after the transition.
    std::optional<DisconnectEvent> event;
};

const char* to_string(Transition::Effect effect);

// UNKNOWN/UP/DOWN state machine for one target. Holds at most one open
// DisconnectEvent; no I/O.
class DisconnectTracker {
public:
    DisconnectTracker(std::string target_name, std::string host);

    Transition on_result(bool success, Timestamp ts);

    HealthState state() const { return state_; }
    const std::optional<DisconnectEvent>& open_event() const { return open_event_; }

private:
    Transition on_success(Timestamp ts);
    Transition on_failure(Timestamp ts);

    std::string target_name_;
    std::string host_;
    HealthState state_ = HealthState::Unknown;
    std::optional<DisconnectEvent> open_event_;
    // Start of the most recent event. Events are keyed by start time, so a
    // new one always starts strictly later.
    std::optional<Timestamp> last_start_;
};
