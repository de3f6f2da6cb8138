#include "CommandDispatcher.hpp"

#include <stdexcept>
#include <utility>

#include "Errors.hpp"
#include "../utils/Utils.hpp"

namespace {
    const std::string USAGE = "notion-cli <command> [key=value ...] [--no-cache]";
    constexpr int MIN_PAGE_SIZE = 1;
    constexpr int MAX_PAGE_SIZE = 100;

    std::optional<int> limitArg(const CommandArgs& args) {
        return CommandDispatcher::optionalIntArg(args, "limit", MIN_PAGE_SIZE, MAX_PAGE_SIZE);
    }

    json requireJsonObject(const CommandArgs& args, const std::string& name) {
        json value = CommandDispatcher::parseJson(CommandDispatcher::requireArg(args, name));
        if (!value.is_object()) {
            throw CommandError(name + " must be a JSON object");
        }
        return value;
    }

    json requireJsonArray(const CommandArgs& args, const std::string& name) {
        json value = CommandDispatcher::parseJson(CommandDispatcher::requireArg(args, name));
        if (!value.is_array()) {
            throw CommandError(name + " must be a JSON array");
        }
        return value;
    }
}

CommandDispatcher::CommandDispatcher(std::shared_ptr<ILogger> logger) : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    registerCommands();
}

bool CommandDispatcher::hasCommand(const std::string& name) const {
    return index_.count(name) > 0;
}

json CommandDispatcher::dispatch(const std::string& name, const CommandArgs& args, NotionClient& client) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw CommandError("Unknown command: " + name + " (run 'notion-cli help' for the command list)");
    }
    logger_->debug("Dispatching command: " + name);
    return commands_[it->second].handler(args, client);
}

json CommandDispatcher::help() const {
    json list = json::array();
    for (const auto& command : commands_) {
        list.push_back({
            {"name", command.name},
            {"arguments", command.arguments},
            {"description", command.description}
        });
    }
    return json{{"usage", USAGE}, {"commands", list}};
}

// --- Argument Helpers ---

std::string CommandDispatcher::requireArg(const CommandArgs& args, const std::string& name) {
    auto it = args.find(name);
    if (it == args.end() || it->second.empty()) {
        throw CommandError("Missing required argument: --" + name);
    }
    return it->second;
}

std::optional<std::string> CommandDispatcher::optionalArg(const CommandArgs& args, const std::string& name) {
    auto it = args.find(name);
    if (it == args.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int> CommandDispatcher::optionalIntArg(const CommandArgs& args, const std::string& name, int min, int max) {
    auto raw = optionalArg(args, name);
    if (!raw) {
        return std::nullopt;
    }
    auto value = Utils::stringToInt(Utils::trim(*raw));
    if (!value || *value < min || *value > max) {
        throw CommandError("--" + name + " must be an integer between " + std::to_string(min)
            + " and " + std::to_string(max) + ", got: " + *raw);
    }
    return value;
}

std::optional<json> CommandDispatcher::optionalJsonArg(const CommandArgs& args, const std::string& name) {
    auto raw = optionalArg(args, name);
    if (!raw || raw->empty()) {
        return std::nullopt;
    }
    return parseJson(*raw);
}

json CommandDispatcher::parseJson(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error&) {
        throw CommandError("Invalid JSON: " + text);
    }
}

json CommandDispatcher::richText(const std::string& text) {
    json content = {{"content", text}};
    json item = {{"text", content}};
    return json::array({item});
}

// --- Command Table ---

void CommandDispatcher::add(std::string name, std::string arguments, std::string description,
                            std::function<json(const CommandArgs&, NotionClient&)> handler) {
    index_[name] = commands_.size();
    commands_.push_back({std::move(name), std::move(arguments), std::move(description), std::move(handler)});
}

void CommandDispatcher::registerCommands() {
    // Search
    add("search", "[query=<text>] [filter=<json>] [cursor=<c>] [limit=1..100]", "Search pages and databases",
        [](const CommandArgs& args, NotionClient& client) {
            SearchRequest options;
            options.filter = optionalJsonArg(args, "filter");
            options.start_cursor = optionalArg(args, "cursor");
            options.page_size = limitArg(args);
            return client.search(optionalArg(args, "query").value_or(""), options);
        });

    // Pages
    add("get-page", "id=<page-id>", "Get a page by ID",
        [](const CommandArgs& args, NotionClient& client) {
            return client.getPage(requireArg(args, "id"));
        });

    add("get-page-content", "id=<page-id> [cursor=<c>] [limit=1..100]", "Get page content (blocks)",
        [](const CommandArgs& args, NotionClient& client) {
            std::string id = requireArg(args, "id");
            PageRequest options;
            options.start_cursor = optionalArg(args, "cursor");
            options.page_size = limitArg(args);
            return client.getBlocks(id, options);
        });

    add("create-page",
        "parent-page=<id> | parent-database=<id> [title=<text>] [properties=<json>] [children=<json-array>]",
        "Create a new page",
        [](const CommandArgs& args, NotionClient& client) {
            auto parent_page = optionalArg(args, "parent-page");
            auto parent_database = optionalArg(args, "parent-database");
            PageParent parent;
            if (parent_database && !parent_database->empty()) {
                parent.database_id = parent_database;
            } else if (parent_page && !parent_page->empty()) {
                parent.page_id = parent_page;
            } else {
                throw CommandError("Either --parent-page or --parent-database is required");
            }

            json properties = json::object();
            if (auto parsed = optionalJsonArg(args, "properties")) {
                if (!parsed->is_object()) {
                    throw CommandError("properties must be a JSON object");
                }
                properties = *parsed;
            }
            auto title = optionalArg(args, "title");
            if (title && !title->empty() && !properties.contains("title")) {
                properties["title"] = {{"title", richText(*title)}};
            }

            auto children = optionalJsonArg(args, "children");
            if (children && !children->is_array()) {
                throw CommandError("children must be a JSON array");
            }
            return client.createPage(parent, properties, children);
        });

    add("update-page", "id=<page-id> properties=<json>", "Update page properties",
        [](const CommandArgs& args, NotionClient& client) {
            std::string id = requireArg(args, "id");
            return client.updatePage(id, requireJsonObject(args, "properties"));
        });

    add("archive-page", "id=<page-id>", "Archive (delete) a page",
        [](const CommandArgs& args, NotionClient& client) {
            return client.archivePage(requireArg(args, "id"));
        });

    // Databases
    add("get-database", "id=<database-id>", "Get database schema",
        [](const CommandArgs& args, NotionClient& client) {
            return client.getDatabase(requireArg(args, "id"));
        });

    add("query-database",
        "id=<database-id> [filter=<json>] [sorts=<json-array>] [cursor=<c>] [limit=1..100]",
        "Query database rows",
        [](const CommandArgs& args, NotionClient& client) {
            std::string id = requireArg(args, "id");
            DatabaseQueryRequest options;
            options.filter = optionalJsonArg(args, "filter");
            options.sorts = optionalJsonArg(args, "sorts");
            options.start_cursor = optionalArg(args, "cursor");
            options.page_size = limitArg(args);
            return client.queryDatabase(id, options);
        });

    add("create-database-row", "id=<database-id> properties=<json>", "Create a row in a database",
        [](const CommandArgs& args, NotionClient& client) {
            std::string id = requireArg(args, "id");
            return client.createDatabaseRow(id, requireJsonObject(args, "properties"));
        });

    add("list-databases", "", "List all accessible databases",
        [](const CommandArgs&, NotionClient& client) {
            return client.listDatabases();
        });

    // Blocks
    add("get-block", "id=<block-id>", "Get a block by ID",
        [](const CommandArgs& args, NotionClient& client) {
            return client.getBlock(requireArg(args, "id"));
        });

    add("append-blocks", "id=<page-or-block-id> children=<json-array>", "Append blocks to a page/block",
        [](const CommandArgs& args, NotionClient& client) {
            std::string id = requireArg(args, "id");
            return client.appendBlocks(id, requireJsonArray(args, "children"));
        });

    add("delete-block", "id=<block-id>", "Delete a block",
        [](const CommandArgs& args, NotionClient& client) {
            return client.deleteBlock(requireArg(args, "id"));
        });

    // Users
    add("list-users", "[cursor=<c>] [limit=1..100]", "List workspace users",
        [](const CommandArgs& args, NotionClient& client) {
            PageRequest options;
            options.start_cursor = optionalArg(args, "cursor");
            options.page_size = limitArg(args);
            return client.listUsers(options);
        });

    add("get-user", "id=<user-id>", "Get a user by ID",
        [](const CommandArgs& args, NotionClient& client) {
            return client.getUser(requireArg(args, "id"));
        });

    add("get-self", "", "Get the bot user info",
        [](const CommandArgs&, NotionClient& client) {
            return client.getSelf();
        });

    // Comments
    add("get-comments", "id=<page-or-block-id> [cursor=<c>] [limit=1..100]", "Get comments on a page/block",
        [](const CommandArgs& args, NotionClient& client) {
            CommentsRequest options;
            options.block_id = requireArg(args, "id");
            options.start_cursor = optionalArg(args, "cursor");
            options.page_size = limitArg(args);
            return client.getComments(options);
        });

    add("create-comment", "id=<page-id> text=<text>", "Create a comment",
        [](const CommandArgs& args, NotionClient& client) {
            NewComment comment;
            comment.page_id = requireArg(args, "id");
            comment.rich_text = richText(requireArg(args, "text"));
            return client.createComment(comment);
        });

    // Cache
    add("cache-stats", "", "Show cache statistics",
        [](const CommandArgs&, NotionClient& client) {
            return client.getCacheStats().to_json();
        });

    add("cache-clear", "", "Clear all cached entries",
        [](const CommandArgs&, NotionClient& client) {
            return json{{"cleared", client.clearCache()}};
        });

    add("cache-invalidate", "key=<cache-key>", "Invalidate one cache entry",
        [](const CommandArgs& args, NotionClient& client) {
            return json{{"invalidated", client.invalidateCacheKey(requireArg(args, "key"))}};
        });

    add("help", "", "Show this command list",
        [this](const CommandArgs&, NotionClient&) {
            return help();
        });
}
