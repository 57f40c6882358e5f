#include "holdem/storage.hpp"
#include "holdem/logging.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace holdem {

void to_json(nlohmann::json& j, const SessionStats& stats) {
    j = nlohmann::json{
        {"hands_played", stats.hands_played},
        {"hands_won", stats.hands_won},
        {"total_profit", stats.total_profit}
    };
}

void from_json(const nlohmann::json& j, SessionStats& stats) {
    j.at("hands_played").get_to(stats.hands_played);
    j.at("hands_won").get_to(stats.hands_won);
    j.at("total_profit").get_to(stats.total_profit);
}

void to_json(nlohmann::json& j, const LeaderboardEntry& entry) {
    j = nlohmann::json{{"date", entry.date}, {"profit", entry.profit}};
}

void from_json(const nlohmann::json& j, LeaderboardEntry& entry) {
    j.at("date").get_to(entry.date);
    j.at("profit").get_to(entry.profit);
}

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryKeyValueStore::put(const std::string& key, const std::string& value) {
    values_[key] = value;
}

FileKeyValueStore::FileKeyValueStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FileKeyValueStore::path_for(const std::string& key) const {
    return directory_ / (key + ".json");
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) {
    std::ifstream in(path_for(key));
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void FileKeyValueStore::put(const std::string& key, const std::string& value) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + directory_.string() + ": " + ec.message());
    }
    std::ofstream out(path_for(key), std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write " + path_for(key).string());
    }
    out << value;
}

KeyValueStatsStore::KeyValueStatsStore(std::shared_ptr<KeyValueStore> store)
    : store_(std::move(store)) {}

SessionStats KeyValueStatsStore::load_stats() {
    auto raw = store_->get(STATS_KEY);
    if (!raw) {
        return SessionStats{};
    }
    try {
        return nlohmann::json::parse(*raw).get<SessionStats>();
    } catch (const nlohmann::json::exception& e) {
        log_warn("storage", "stats_unreadable", {{"error", e.what()}});
        return SessionStats{};
    }
}

void KeyValueStatsStore::save_stats(const SessionStats& stats) {
    store_->put(STATS_KEY, nlohmann::json(stats).dump());
}

std::vector<LeaderboardEntry> KeyValueStatsStore::load_leaderboard() {
    auto raw = store_->get(LEADERBOARD_KEY);
    if (!raw) {
        return {};
    }
    try {
        return nlohmann::json::parse(*raw).get<std::vector<LeaderboardEntry>>();
    } catch (const nlohmann::json::exception& e) {
        log_warn("storage", "leaderboard_unreadable", {{"error", e.what()}});
        return {};
    }
}

void KeyValueStatsStore::save_leaderboard(const std::vector<LeaderboardEntry>& entries) {
    store_->put(LEADERBOARD_KEY, nlohmann::json(entries).dump());
}

void insert_leaderboard_entry(std::vector<LeaderboardEntry>& entries, LeaderboardEntry entry) {
    entries.push_back(std::move(entry));
    std::stable_sort(entries.begin(), entries.end(),
                     [](const LeaderboardEntry& a, const LeaderboardEntry& b) {
                         return a.profit > b.profit;
                     });
    if (entries.size() > kLeaderboardSize) {
        entries.resize(kLeaderboardSize);
    }
}

}  // namespace holdem
