#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "ai_player.hpp"
#include "output_projector.hpp"
#include "text_renderer.hpp"
#include "table.hpp"
#include "table_flow.hpp"
#include "holdem/config.hpp"
#include "holdem/logging.hpp"
#include "holdem/storage.hpp"
#include "holdem/task_queue.hpp"

namespace {

constexpr int HUMAN_SEAT = 0;
constexpr const char* DOMAIN = "cli";

std::string today() {
    std::time_t now = std::time(nullptr);
    std::tm tm_val;
    localtime_r(&now, &tm_val);
    std::stringstream ss;
    ss << std::put_time(&tm_val, "%Y-%m-%d");
    return ss.str();
}

/// Runs scheduled continuations in real time until nothing is pending.
void pump(holdem::TaskQueue& queue) {
    while (auto due = queue.next_due()) {
        std::this_thread::sleep_until(*due);
        queue.run_ready();
    }
}

void report(holdem::ActionOutcome outcome) {
    if (outcome != holdem::ActionOutcome::Applied) {
        std::cout << "Not now: " << holdem::to_string(outcome) << std::endl;
    }
}

/// Parses one line of input and forwards it to the table. Returns false on quit.
bool handle_command(table::Table& table, holdem::Config& config, const std::string& line) {
    std::istringstream in(line);
    std::string command;
    in >> command;

    if (command == "q" || command == "quit") {
        return false;
    }
    if (command == "n" || command == "next") {
        report(table.start_hand());
        return true;
    }
    if (command == "s" || command == "speed") {
        std::string value;
        in >> value;
        try {
            config.set("speed", value);
        } catch (const std::invalid_argument& e) {
            std::cout << e.what() << std::endl;
            return true;
        }
        table.set_pacing(holdem::pacing_delay(config.speed));
        holdem::log_info(DOMAIN, "pacing_changed", {{"pacing_ms", table.pacing().count()}});
        return true;
    }

    poker::PlayerAction action;
    action.set_seat(HUMAN_SEAT);
    if (command == "f" || command == "fold") {
        action.set_action(poker::FOLD);
    } else if (command == "c" || command == "call" || command == "check") {
        action.set_action(table.get_state().can_check() ? poker::CHECK : poker::CALL);
    } else if (command == "r" || command == "raise") {
        std::string amount;
        in >> amount;
        std::optional<int64_t> total =
            projector::TextRenderer::raise_preset(table.get_state(), HUMAN_SEAT, amount);
        if (!total) {
            try {
                std::size_t used = 0;
                total = std::stoll(amount, &used);
                if (used != amount.size()) {
                    total.reset();
                }
            } catch (const std::exception&) {
                total.reset();
            }
        }
        if (!total) {
            std::cout << "Usage: r <total bet|half|pot|2x|allin>" << std::endl;
            return true;
        }
        action.set_action(poker::RAISE);
        action.set_amount(*total);
    } else {
        if (!command.empty()) {
            std::cout << "Unknown command '" << command << "'" << std::endl;
        }
        return true;
    }

    report(table.perform_action(action));
    return true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    holdem::Config config;
    try {
        config = holdem::Config::load(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "holdem: " << e.what() << std::endl;
        return 2;
    }
    holdem::set_log_level(config.log_level);

    auto store = std::make_shared<holdem::KeyValueStatsStore>(
        std::make_shared<holdem::FileKeyValueStore>(config.data_dir));

    table::Table::Options options;
    options.small_blind = config.small_blind;
    options.big_blind = config.big_blind;
    options.buy_in = config.buy_in;
    options.pacing = holdem::pacing_delay(config.speed);
    options.deck_seed = config.seed;

    holdem::TaskQueue queue;
    table::Table table(store, queue, config.players, options);

    ai::AiPlayer bot = config.seed ? ai::AiPlayer(*config.seed + 1) : ai::AiPlayer();
    table_flow::TableFlow flow(table, queue,
        [&bot](const poker::TableSnapshot& snapshot, int seat) { return bot.decide(snapshot, seat); });

    projector::OutputProjector output(
        [](const std::string& text) { std::cout << text << std::endl; }, HUMAN_SEAT);
    for (const auto& seat : table.get_state().seats()) {
        output.set_player_name(seat.seat(), seat.name());
    }
    table.subscribe_events([&output](const google::protobuf::Any& event) { output.handle_event(event); });

    int64_t session_profit = 0;
    table.subscribe_hand_complete([&session_profit, &table, &output](const poker::HandComplete& event) {
        session_profit += event.profit();
        std::cout << output.renderer().render_stats(table.stats(), table.leaderboard()) << std::flush;
    });

    holdem::log_info(DOMAIN, "session_started", {
        {"players", config.players},
        {"data_dir", config.data_dir},
        {"hands_played", table.stats().hands_played}
    });

    std::cout << "Texas Hold'em - " << config.players << " players, blinds "
              << config.small_blind << "/" << config.big_blind << ", buy-in " << config.buy_in << "\n"
              << "Lifetime: " << table.stats().hands_played << " hands, "
              << table.stats().hands_won << " won, profit " << table.stats().total_profit << std::endl;

    std::string line;
    while (true) {
        pump(queue);

        auto snapshot = table.get_state();
        std::cout << "\n" << output.renderer().render_table(snapshot, HUMAN_SEAT);
        if (snapshot.current_player_index() == HUMAN_SEAT && snapshot.valid_actions_size() > 0) {
            std::cout << output.renderer().render_prompt(snapshot);
        } else {
            std::cout << "[n]ext hand [s]peed <0|1|2> [q]uit";
        }
        std::cout << "\n> " << std::flush;

        if (!std::getline(std::cin, line)) {
            break;
        }
        if (!handle_command(table, config, line)) {
            break;
        }
    }

    table.add_to_leaderboard(holdem::LeaderboardEntry{today(), session_profit});
    holdem::log_info(DOMAIN, "session_ended", {{"profit", session_profit}});

    std::cout << "Session profit: " << session_profit << "\n"
              << output.renderer().render_stats(table.stats(), table.leaderboard()) << std::flush;
    return 0;
}
