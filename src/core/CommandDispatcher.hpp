#ifndef COMMANDDISPATCHER_HPP
#define COMMANDDISPATCHER_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "NotionClient.hpp"
#include "../interfaces/ILogger.hpp"

using json = nlohmann::json;

using CommandArgs = std::map<std::string, std::string>;

struct Command {
    std::string name;
    std::string arguments;   // shown by "help", e.g. "id=<page-id>"
    std::string description;
    std::function<json(const CommandArgs&, NotionClient&)> handler;
};

// Maps "notion-cli <command> key=value..." onto NotionClient calls.
// Bad input (unknown command, missing or malformed argument) throws
// CommandError before anything is sent to the API.
class CommandDispatcher {
public:
    explicit CommandDispatcher(std::shared_ptr<ILogger> logger);

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    bool hasCommand(const std::string& name) const;
    json dispatch(const std::string& name, const CommandArgs& args, NotionClient& client) const;

    // {"usage": ..., "commands": [{"name", "arguments", "description"}, ...]}
    json help() const;
    const std::vector<Command>& commands() const { return commands_; }

    // --- Argument Helpers ---
    static std::string requireArg(const CommandArgs& args, const std::string& name);
    static std::optional<std::string> optionalArg(const CommandArgs& args, const std::string& name);
    static std::optional<int> optionalIntArg(const CommandArgs& args, const std::string& name, int min, int max);
    static std::optional<json> optionalJsonArg(const CommandArgs& args, const std::string& name);
    static json parseJson(const std::string& text);
    // [{"text": {"content": text}}]
    static json richText(const std::string& text);

private:
    void registerCommands();
    void add(std::string name, std::string arguments, std::string description,
             std::function<json(const CommandArgs&, NotionClient&)> handler);

    std::shared_ptr<ILogger> logger_;
    std::vector<Command> commands_;
    std::map<std::string, size_t> index_;
};

#endif // COMMANDDISPATCHER_HPP
