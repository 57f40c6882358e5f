#pragma once

#include <stdexcept>
#include <string>

namespace holdem {

/// Result of a table command. Anything other than Applied left the table untouched.
enum class ActionOutcome {
    Applied,
    HandInProgress,
    NoHandInProgress,
    NotEnoughPlayers,
    InvalidActor,
    PlayerCannotAct,
    IllegalAction
};

inline const char* to_string(ActionOutcome outcome) {
    switch (outcome) {
        case ActionOutcome::Applied: return "applied";
        case ActionOutcome::HandInProgress: return "hand_in_progress";
        case ActionOutcome::NoHandInProgress: return "no_hand_in_progress";
        case ActionOutcome::NotEnoughPlayers: return "not_enough_players";
        case ActionOutcome::InvalidActor: return "invalid_actor";
        case ActionOutcome::PlayerCannotAct: return "player_cannot_act";
        case ActionOutcome::IllegalAction: return "illegal_action";
    }
    return "unknown";
}

/// Thrown by command handlers when a command is rejected.
/// The table converts it into an ActionOutcome; it never reaches collaborators.
class ActionRejectedError : public std::runtime_error {
public:
    ActionOutcome outcome;

    ActionRejectedError(const std::string& message, ActionOutcome outcome)
        : std::runtime_error(message), outcome(outcome) {}

    static ActionRejectedError hand_in_progress(const std::string& message) {
        return ActionRejectedError(message, ActionOutcome::HandInProgress);
    }

    static ActionRejectedError no_hand_in_progress(const std::string& message) {
        return ActionRejectedError(message, ActionOutcome::NoHandInProgress);
    }

    static ActionRejectedError not_enough_players(const std::string& message) {
        return ActionRejectedError(message, ActionOutcome::NotEnoughPlayers);
    }

    static ActionRejectedError invalid_actor(const std::string& message) {
        return ActionRejectedError(message, ActionOutcome::InvalidActor);
    }

    static ActionRejectedError player_cannot_act(const std::string& message) {
        return ActionRejectedError(message, ActionOutcome::PlayerCannotAct);
    }

    static ActionRejectedError illegal_action(const std::string& message) {
        return ActionRejectedError(message, ActionOutcome::IllegalAction);
    }
};

/// Drawing from an exhausted deck. Unreachable with at most nine seats;
/// hitting it means the dealing logic is broken.
class EmptyDeckError : public std::logic_error {
public:
    explicit EmptyDeckError(const std::string& message)
        : std::logic_error(message) {}
};

}  // namespace holdem
