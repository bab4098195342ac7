#include "disconnect_tracker.hpp"
#include <algorithm>
#include <utility>

const char* to_string(Transition::Effect effect) {
    switch (effect) {
        case Transition::Effect::None: return "none";
        case Transition::Effect::Opened: return "opened";
        case Transition::Effect::Extended: return "extended";
        case Transition::Effect::Closed: return "closed";
    }
    return "none";
}

DisconnectTracker::DisconnectTracker(std::string target_name, std::string host)
    : target_name_(std::move(target_name)), host_(std::move(host)) {}

Transition DisconnectTracker::on_result(bool success, Timestamp ts) {
    return success ? on_success(ts) : on_failure(ts);
}

Transition DisconnectTracker::on_success(Timestamp ts) {
    Transition t;
    t.from = state_;
    t.to = HealthState::Up;

    if (state_ == HealthState::Down && open_event_) {
        // The start can only be later than ts if the caller broke ordering.
        open_event_->end_time = std::max(ts, open_event_->start_time);
        t.effect = Transition::Effect::Closed;
        t.event = std::move(open_event_);
        open_event_.reset();
    }

    state_ = HealthState::Up;
    return t;
}

Transition DisconnectTracker::on_failure(Timestamp ts) {
    Transition t;
    t.from = state_;
    t.to = HealthState::Down;

    switch (state_) {
        case HealthState::Unknown:
            // First-ever result failed: DOWN without an event.
            break;
        case HealthState::Up: {
            DisconnectEvent event;
            event.target_name = target_name_;
            event.host = host_;
            event.start_time = ts;
            if (last_start_ && event.start_time <= *last_start_) {
                event.start_time = *last_start_ + std::chrono::milliseconds(1);
            }
            last_start_ = event.start_time;
            event.consecutive_failure_count = 1;
            open_event_ = event;
            t.effect = Transition::Effect::Opened;
            t.event = open_event_;
            break;
        }
        case HealthState::Down:
            if (open_event_) {
                ++open_event_->consecutive_failure_count;
                t.effect = Transition::Effect::Extended;
                t.event = open_event_;
            }
            break;
    }

    state_ = HealthState::Down;
    return t;
}
