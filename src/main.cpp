#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

#include "cache/HiredisConnection.hpp"
#include "cache/RemoteTierClient.hpp"
#include "config/AppConfig.hpp"
#include "core/BeastHttpServer.hpp"
#include "core/CacheAdminService.hpp"
#include "core/CacheEngine.hpp"
#include "core/ResponseCacheMiddleware.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/StatsDCacheObserver.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;

// --- Helper Function to Initialize StatsD Client ---
// statsd_endpoint wins over the STATSD_SERVER variable.
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    std::string endpoint = config.statsd_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (endpoint.empty() && statsd_server_value != nullptr) {
        endpoint = std::string(statsd_server_value);
    }
    return makeStatsDClient(config, logger_, endpoint);
}

// --- Helper Function to Initialize the Remote Tier ---
std::shared_ptr<RemoteTierClient> initializeRemoteTier(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    if (!config.use_remote) {
        logger_->setup("Remote tier disabled (use_remote=false). Running memory-only.");
        return nullptr;
    }
    // Cluster nodes only expose database 0.
    auto factory = std::make_shared<HiredisConnectionFactory>(config, logger_, !config.remote_cluster_mode);
    return std::make_shared<RemoteTierClient>(config, logger_, factory);
}

// --- Helper Function to Load the Warm-up File ---
void loadWarmUpFile(const AppConfig& config, CacheEngine& engine, std::shared_ptr<ILogger> logger_) {
    if (config.warmup_file.empty()) {
        return;
    }
    std::ifstream file(config.warmup_file);
    if (!file.is_open()) {
        logger_->error("Warm-up file " + config.warmup_file + " could not be opened. Starting cold.");
        return;
    }
    try {
        json document = json::parse(file);
        std::vector<std::string> errors;
        auto items = Utils::parseWarmUpItems(document, &errors);
        for (const auto& error : errors) {
            logger_->warn("Warm-up file " + config.warmup_file + ": " + error);
        }
        std::size_t loaded = engine.warmUp(items);
        logger_->setup("Warm-up loaded " + std::to_string(loaded) + " entries from " + config.warmup_file);
    } catch (const std::exception& e) {
        logger_->error("Warm-up file " + config.warmup_file + " is not usable: " + e.what() + ". Starting cold.");
    }
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        auto console_logger = ConsoleLogger::getInstance(config_.log_level);
        console_logger->setLogLevel(config_.log_level);
        std::shared_ptr<ILogger> logger_ = console_logger;
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);

        // --- Cache engine ---
        auto remote_tier = initializeRemoteTier(config_, logger_);
        auto engine = std::make_shared<CacheEngine>(config_, logger_, remote_tier);
        engine->subscribe(std::make_shared<StatsDCacheObserver>(statsd_client, config_));
        engine->init();
        loadWarmUpFile(config_, *engine, logger_);

        auto middleware = std::make_shared<ResponseCacheMiddleware>(engine, config_, logger_);
        auto admin_service = std::make_shared<CacheAdminService>(engine, middleware, statsd_client, config_, logger_);

        // --- Admin server ---
        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc);

        auto beast_server = std::make_shared<BeastHttpServer>(
            ioc,
            tcp::endpoint{net::ip::make_address("0.0.0.0"), static_cast<unsigned short>(config_.admin_port)},
            admin_service,
            logger_,
            config_);
        beast_server->run();

        std::vector<std::thread> ioc_threads;
        logger_->setup("Starting " + std::to_string(config_.num_io_threads) + " I/O threads for the admin server.");
        for (unsigned int i = 0; i < config_.num_io_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger_, i]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger_->error("Exception in admin I/O thread " + std::to_string(i) + ": " + e.what());
                }
                logger_->debug("Admin I/O thread " + std::to_string(i) + " exiting.");
            });
        }

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const beast::error_code&, int signal_number) {
            logger_->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
            beast_server->stop();
            work_guard.reset();
            ioc.stop();
        });

        logger_->setup("TierCache admin server running on port " + std::to_string(config_.admin_port) + ". Press Ctrl+C to exit.");
        try {
            ioc.run();
        } catch (const std::exception& e) {
            logger_->error("Exception in main thread ioc.run(): " + std::string(e.what()));
        }

        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        logger_->setup("Admin I/O threads joined.");

        admin_service->shutdown();
        engine->shutdown(config_.drain_backfill_on_shutdown);
        logger_->setup("TierCache stopped.");
        return 0;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return 1;
    }
}
