#include "bots/command_handler.hpp"
#include "bots/reminder_scheduler.hpp"
#include "notifications/discord_client.hpp"
#include "server/event_server.hpp"
#include "storage/preference_store.hpp"
#include "storage/reminder_store.hpp"
#include "storage/snapshot_persistence.hpp"
#include "time/zoned_time.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>

tickler::EventServer* g_server = nullptr;

void signalHandler(int) {
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    // TZ must exist before any thread reads the environment.
    tickler::TimeZone::pinProcessZone();

    auto& logger = tickler::Logger::getInstance();

    tickler::Config config;
    std::string config_error;
    if (!tickler::Config::fromEnvironment(config, &config_error)) {
        logger.error("Configuration error: " + config_error);
        return 1;
    }

    // Allow port override via command line argument
    if (argc > 1 && !tickler::Config::parsePort(argv[1], config.listen_port)) {
        logger.error(std::string("Invalid port argument: ") + argv[1]);
        return 1;
    }

    logger.setMinLevel(tickler::Logger::levelFromString(config.log_level));
    if (!config.log_file.empty()) {
        logger.setLogFile(config.log_file);
    }
    logger.info("Starting Tickler...");

    tickler::ReminderStore reminders;
    tickler::PreferenceStore preferences(config.default_timezone);
    tickler::SnapshotPersistence persistence(config.data_dir);

    try {
        persistence.load(reminders, preferences);
    } catch (const std::exception& e) {
        logger.error(std::string("Failed to load saved state from ") + config.data_dir + ": " + e.what());
        return 1;
    }
    logger.info("Loaded reminders for " + std::to_string(reminders.userCount()) + " users");

    tickler::SnapshotWriter writer(persistence, reminders, preferences);
    writer.start();

    tickler::DiscordClient discord(config.discord_token, config.discord_api);

    tickler::CommandHandler handler(reminders, preferences, [&writer]() { writer.requestSave(); });
    tickler::ReminderScheduler scheduler(reminders, discord,
                                         std::chrono::milliseconds(config.tick_ms),
                                         [&writer]() { writer.requestSave(); });
    scheduler.start();

    tickler::EventServer server(config.listen_address, config.listen_port,
                                handler, discord, config.event_secret, config.io_threads);
    g_server = &server;

    const bool served = server.start();
    g_server = nullptr;

    std::cout << "\nShutting down..." << std::endl;
    scheduler.stop();
    writer.stop();

    if (!served) {
        logger.error("Failed to start event server");
        return 1;
    }
    return 0;
}
