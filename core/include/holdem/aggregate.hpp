#pragma once

#include <functional>
#include <utility>
#include <vector>
#include <google/protobuf/any.pb.h>

namespace holdem {

/// Base class for event-sourced aggregates using CRTP pattern.
/// Derived classes must implement:
///   - void apply_event_impl(State& state, const google::protobuf::Any& event)
/// State is only ever changed by applying events; every applied event is
/// published to the event listeners.
template<typename Derived, typename State>
class Aggregate {
public:
    using EventListener = std::function<void(const google::protobuf::Any&)>;

    Aggregate() : state_{} {}
    virtual ~Aggregate() = default;

    /// Get the current state (const reference).
    const State& state() const { return state_; }

    void subscribe_events(EventListener listener) {
        event_listeners_.push_back(std::move(listener));
    }

protected:
    template<typename EventType>
    void apply(const EventType& event) {
        google::protobuf::Any event_any;
        event_any.PackFrom(event);
        static_cast<Derived*>(this)->apply_event_impl(state_, event_any);
        for (const auto& listener : event_listeners_) {
            listener(event_any);
        }
    }

    State state_;

private:
    std::vector<EventListener> event_listeners_;
};

}  // namespace holdem
