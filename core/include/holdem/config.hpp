#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "holdem/logging.hpp"

namespace holdem {

/// Pacing of automated turns and the all-in deal-out.
enum class Speed {
    Instant = 0,
    Normal = 1,
    Slow = 2
};

std::chrono::milliseconds pacing_delay(Speed speed);

struct Config {
    int players = 6;
    Speed speed = Speed::Normal;
    int64_t buy_in = 200;
    int64_t small_blind = 1;
    int64_t big_blind = 2;
    std::string data_dir = ".holdem";
    LogLevel log_level = LogLevel::Warn;
    std::optional<uint64_t> seed;

    /// Defaults, then HOLDEM_* environment variables, then --key=value arguments.
    /// Throws std::invalid_argument naming the offending key.
    static Config load(int argc, const char* const* argv);

    /// Applies a single setting by its command-line key (e.g. "players", "speed").
    void set(const std::string& key, const std::string& value);

    /// Throws std::invalid_argument if the combination is unusable.
    void validate() const;
};

}  // namespace holdem
