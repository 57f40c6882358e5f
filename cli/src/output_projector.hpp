#pragma once

#include <functional>
#include <string>
#include <google/protobuf/any.pb.h>
#include "text_renderer.hpp"

namespace projector {

/// Projector that subscribes to table events and outputs text.
class OutputProjector {
public:
    using OutputFn = std::function<void(const std::string&)>;

    explicit OutputProjector(OutputFn output_fn, int viewer_seat = 0, bool show_timestamps = false);

    /// Set display name for a seat.
    void set_player_name(int seat, const std::string& name);

    /// Handle a single table event.
    void handle_event(const google::protobuf::Any& event_any);

    const TextRenderer& renderer() const { return renderer_; }

private:
    void emit(const std::string& text, const google::protobuf::Timestamp* at);

    TextRenderer renderer_;
    OutputFn output_fn_;
    int viewer_seat_;
    bool show_timestamps_;
};

} // namespace projector
