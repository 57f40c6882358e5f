#include "output_projector.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace projector {

OutputProjector::OutputProjector(OutputFn output_fn, int viewer_seat, bool show_timestamps)
    : output_fn_(std::move(output_fn))
    , viewer_seat_(viewer_seat)
    , show_timestamps_(show_timestamps) {}

void OutputProjector::set_player_name(int seat, const std::string& name) {
    renderer_.set_player_name(seat, name);
}

void OutputProjector::handle_event(const google::protobuf::Any& event_any) {
    std::string text;
    const google::protobuf::Timestamp* at = nullptr;

    if (event_any.Is<poker::PlayersSeated>()) {
        poker::PlayersSeated event;
        if (event_any.UnpackTo(&event)) {
            text = renderer_.render_players_seated(event);
        }
    } else if (event_any.Is<poker::SittingOutChanged>()) {
        poker::SittingOutChanged event;
        if (event_any.UnpackTo(&event)) {
            text = renderer_.render_sitting_out_changed(event);
        }
    } else if (event_any.Is<poker::HandStarted>()) {
        poker::HandStarted event;
        if (event_any.UnpackTo(&event)) {
            text = renderer_.render_hand_started(event);
            emit(text, &event.started_at());
            return;
        }
    } else if (event_any.Is<poker::BlindPosted>()) {
        poker::BlindPosted event;
        if (event_any.UnpackTo(&event)) {
            text = renderer_.render_blind_posted(event);
            emit(text, &event.posted_at());
            return;
        }
    } else if (event_any.Is<poker::CardsDealt>()) {
        poker::CardsDealt event;
        if (event_any.UnpackTo(&event)) {
            text = renderer_.render_cards_dealt(event, viewer_seat_);
            emit(text, &event.dealt_at());
            return;
        }
    } else if (event_any.Is<poker::ActionTaken>()) {
        poker::ActionTaken event;
        if (event_any.UnpackTo(&event)) {
            text = renderer_.render_action_taken(event);
            emit(text, &event.action_at());
            return;
        }
    } else if (event_any.Is<poker::CommunityCardsDealt>()) {
        poker::CommunityCardsDealt event;
        if (event_any.UnpackTo(&event)) {
            text = renderer_.render_community_cards_dealt(event);
            emit(text, &event.dealt_at());
            return;
        }
    } else if (event_any.Is<poker::ShowdownStarted>()) {
        poker::ShowdownStarted event;
        if (event_any.UnpackTo(&event)) {
            text = renderer_.render_showdown_started(event);
        }
    } else if (event_any.Is<poker::PotAwarded>()) {
        poker::PotAwarded event;
        if (event_any.UnpackTo(&event)) {
            text = renderer_.render_pot_awarded(event);
        }
    } else if (event_any.Is<poker::HandComplete>()) {
        poker::HandComplete event;
        if (event_any.UnpackTo(&event)) {
            text = renderer_.render_hand_complete(event);
        }
    } else if (event_any.Is<poker::TurnAdvanced>()) {
        // Shown through the table view.
        return;
    } else {
        text = "[Unknown event type: " + event_any.type_url() + "]";
    }

    emit(text, at);
}

void OutputProjector::emit(const std::string& text, const google::protobuf::Timestamp* at) {
    if (text.empty()) {
        return;
    }
    if (show_timestamps_ && at && at->seconds() > 0) {
        std::time_t time_t_val = static_cast<std::time_t>(at->seconds());
        std::tm tm_val;
        gmtime_r(&time_t_val, &tm_val);

        std::stringstream ss;
        ss << "[" << std::put_time(&tm_val, "%H:%M:%S") << "] " << text;
        output_fn_(ss.str());
    } else {
        output_fn_(text);
    }
}

} // namespace projector
