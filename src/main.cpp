#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/InMemoryCache.hpp"
#include "config/AppConfig.hpp"
#include "core/BeastHttpClient.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/Errors.hpp"
#include "core/NotionClient.hpp"
#include "logging/ConsoleLogger.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;
using namespace std;

// --- Helper Function to Initialize Cache ---
std::shared_ptr<CacheInterface> initializeCache(const AppConfig& config_, std::shared_ptr<ILogger> logger_) {
    logger_->setup("Creating InMemoryCache with namespace '" + config_.cache_namespace + "'.");
    return std::make_shared<InMemoryCache>(config_.cache_namespace, config_.defaultTtl(), logger_);
}

// --- Main Function ---
int main(int argc, char** argv) {
    // Logging starts at CERROR and is raised once the configuration is known
    std::shared_ptr<ConsoleLogger> logger_ = ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR);
    try {
        CommandDispatcher dispatcher(logger_);

        if (argc < 2) {
            std::cout << dispatcher.help().dump(2) << std::endl;
            return 1;
        }
        string command = argv[1];
        if (command == "help" || command == "--help" || command == "-h") {
            std::cout << dispatcher.help().dump(2) << std::endl;
            return 0;
        }
        if (!dispatcher.hasCommand(command)) {
            throw CommandError("Unknown command: " + command + " (run 'notion-cli help' for the command list)");
        }

        // Process command-line arguments.
        vector<string> args_vec;
        for (int i = 2; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            logger_->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }
        map<string, string> commandArguments = parsedArgsOpt.value();

        // Load Configuration
        AppConfig config_ = Utils::loadConfiguration(commandArguments);
        logger_->setLogLevel(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<CacheInterface> cache_instance = initializeCache(config_, logger_);
        auto http_client = std::make_shared<BeastHttpClient>(config_, logger_);
        auto notion_client = std::make_shared<NotionClient>(config_, cache_instance, http_client, logger_);

        auto no_cache = commandArguments.find("no-cache");
        if (no_cache != commandArguments.end() && no_cache->second != "false") {
            notion_client->disableCache();
        }

        json result = dispatcher.dispatch(command, commandArguments, *notion_client);
        std::cout << result.dump(2) << std::endl;

        if (logger_->isDebugEnabled()) {
            logger_->debug("Cache stats: " + notion_client->getCacheStats().to_json().dump());
        }
        return 0;
    } catch (const std::exception& e) {
        logger_->error(e.what());
        return 1;
    } catch (...) {
        logger_->error("Unknown error occurred. Exiting.");
        return 1;
    }
}
