#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace holdem {

struct SessionStats {
    int64_t hands_played = 0;
    int64_t hands_won = 0;
    int64_t total_profit = 0;
};

struct LeaderboardEntry {
    std::string date;
    int64_t profit = 0;
};

constexpr std::size_t kLeaderboardSize = 20;

void to_json(nlohmann::json& j, const SessionStats& stats);
void from_json(const nlohmann::json& j, SessionStats& stats);
void to_json(nlohmann::json& j, const LeaderboardEntry& entry);
void from_json(const nlohmann::json& j, LeaderboardEntry& entry);

/// Opaque string store, one value per key.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const std::string& value) = 0;
};

class MemoryKeyValueStore : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;

private:
    std::map<std::string, std::string> values_;
};

/// One file per key inside `directory`, created on first write.
class FileKeyValueStore : public KeyValueStore {
public:
    explicit FileKeyValueStore(std::filesystem::path directory);

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;

private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path directory_;
};

/// Persistence port used by the table at hand completion.
class StatsStore {
public:
    virtual ~StatsStore() = default;
    virtual SessionStats load_stats() = 0;
    virtual void save_stats(const SessionStats& stats) = 0;
    virtual std::vector<LeaderboardEntry> load_leaderboard() = 0;
    virtual void save_leaderboard(const std::vector<LeaderboardEntry>& entries) = 0;
};

/// StatsStore encoding records as JSON in a KeyValueStore.
/// Unreadable records load as a fresh zeroed record / empty leaderboard.
class KeyValueStatsStore : public StatsStore {
public:
    static constexpr const char* STATS_KEY = "holdem_stats";
    static constexpr const char* LEADERBOARD_KEY = "holdem_leaderboard";

    explicit KeyValueStatsStore(std::shared_ptr<KeyValueStore> store);

    SessionStats load_stats() override;
    void save_stats(const SessionStats& stats) override;
    std::vector<LeaderboardEntry> load_leaderboard() override;
    void save_leaderboard(const std::vector<LeaderboardEntry>& entries) override;

private:
    std::shared_ptr<KeyValueStore> store_;
};

/// Appends, orders by profit (best first) and keeps the best kLeaderboardSize entries.
void insert_leaderboard_entry(std::vector<LeaderboardEntry>& entries, LeaderboardEntry entry);

}  // namespace holdem
