#include "holdem/config.hpp"
#include <cstdlib>
#include <stdexcept>
#include <utility>
#include <vector>

namespace holdem {

namespace {

int64_t parse_integer(const std::string& key, const std::string& value) {
    try {
        std::size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
}

const std::vector<std::pair<const char*, const char*>>& env_keys() {
    static const std::vector<std::pair<const char*, const char*>> keys = {
        {"HOLDEM_PLAYERS", "players"},
        {"HOLDEM_SPEED", "speed"},
        {"HOLDEM_BUY_IN", "buy-in"},
        {"HOLDEM_SMALL_BLIND", "small-blind"},
        {"HOLDEM_BIG_BLIND", "big-blind"},
        {"HOLDEM_DATA_DIR", "data-dir"},
        {"HOLDEM_LOG_LEVEL", "log-level"},
        {"HOLDEM_SEED", "seed"}
    };
    return keys;
}

} // anonymous namespace

std::chrono::milliseconds pacing_delay(Speed speed) {
    switch (speed) {
        case Speed::Instant: return std::chrono::milliseconds(50);
        case Speed::Normal: return std::chrono::milliseconds(600);
        case Speed::Slow: return std::chrono::milliseconds(1200);
    }
    return std::chrono::milliseconds(600);
}

void Config::set(const std::string& key, const std::string& value) {
    if (key == "players") {
        players = static_cast<int>(parse_integer(key, value));
    } else if (key == "speed") {
        int64_t s = parse_integer(key, value);
        if (s < 0 || s > 2) {
            throw std::invalid_argument("Invalid value for speed: '" + value + "' (expected 0, 1 or 2)");
        }
        speed = static_cast<Speed>(s);
    } else if (key == "buy-in") {
        buy_in = parse_integer(key, value);
    } else if (key == "small-blind") {
        small_blind = parse_integer(key, value);
    } else if (key == "big-blind") {
        big_blind = parse_integer(key, value);
    } else if (key == "data-dir") {
        data_dir = value;
    } else if (key == "log-level") {
        try {
            log_level = parse_log_level(value);
        } catch (const std::invalid_argument&) {
            throw std::invalid_argument("Invalid value for log-level: '" + value + "'");
        }
    } else if (key == "seed") {
        seed = static_cast<uint64_t>(parse_integer(key, value));
    } else {
        throw std::invalid_argument("Unknown setting: " + key);
    }
}

void Config::validate() const {
    if (players < 2 || players > 9) {
        throw std::invalid_argument("players must be between 2 and 9");
    }
    if (small_blind <= 0 || big_blind < small_blind) {
        throw std::invalid_argument("blinds must satisfy 0 < small-blind <= big-blind");
    }
    if (buy_in <= 0) {
        throw std::invalid_argument("buy-in must be positive");
    }
    if (data_dir.empty()) {
        throw std::invalid_argument("data-dir must not be empty");
    }
}

Config Config::load(int argc, const char* const* argv) {
    Config config;

    for (const auto& [env_name, key] : env_keys()) {
        const char* env_value = std::getenv(env_name);
        if (env_value) {
            config.set(key, env_value);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--") != 0 || arg.find('=') == std::string::npos) {
            throw std::invalid_argument("Expected --key=value, got: " + arg);
        }
        auto eq = arg.find('=');
        config.set(arg.substr(2, eq - 2), arg.substr(eq + 1));
    }

    config.validate();
    return config;
}

}  // namespace holdem
