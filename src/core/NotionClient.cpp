#include "NotionClient.hpp"

#include <string>
#include <utility>
#include <vector>

#include "../cache/CacheKey.hpp"
#include "../utils/Utils.hpp"

namespace {
    template <typename T>
    json orNull(const std::optional<T>& value) {
        if (value) {
            return json(*value);
        }
        return json(nullptr);
    }

    // Parent page or block id from a block object: {"parent": {"type": "page_id", "page_id": "..."}}
    std::optional<std::string> parentIdOf(const json& block) {
        auto parent = block.find("parent");
        if (parent == block.end() || !parent->is_object()) {
            return std::nullopt;
        }
        for (const char* field : {"page_id", "block_id"}) {
            auto id = parent->find(field);
            if (id != parent->end() && id->is_string()) {
                return id->get<std::string>();
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> toQueryValue(const std::optional<int>& value) {
        if (value) {
            return std::to_string(*value);
        }
        return std::nullopt;
    }
}

// --- Cache Control ---

void NotionClient::disableCache() {
    cache_disabled_.store(true);
    cache_->disable();
    logger_->debug("Cache disabled");
}

void NotionClient::enableCache() {
    cache_disabled_.store(false);
    cache_->enable();
    logger_->debug("Cache enabled");
}

CacheStats NotionClient::getCacheStats() const {
    return cache_->getStats();
}

size_t NotionClient::clearCache() {
    return cache_->clear();
}

bool NotionClient::invalidateCacheKey(const std::string& key) {
    return cache_->invalidate(key);
}

// --- Internal Helpers ---

json NotionClient::cached(const std::string& key,
                          std::chrono::milliseconds ttl,
                          const FetchCoordinator::Producer& producer) {
    FetchOptions options;
    options.ttl = ttl;
    options.bypass_cache = cache_disabled_.load();
    options.single_flight = config_.cache_single_flight;
    return fetcher_->getOrFetch(key, producer, options);
}

size_t NotionClient::invalidateMatching(const std::regex& pattern, const std::string& description) {
    size_t removed = cache_->invalidatePattern(pattern);
    if (removed > 0 && logger_->isDebugEnabled()) {
        logger_->debug("Invalidated " + std::to_string(removed) + " cached entries for " + description);
    }
    return removed;
}

size_t NotionClient::invalidateOperation(const std::string& operation) {
    return invalidateMatching(CacheKey::operationPattern(cache_->qualify(operation)), operation + "/*");
}

// --- Search ---

json NotionClient::search(const std::string& query, const SearchRequest& options) {
    std::string key = CacheKey::make("search", {
        {"query", query},
        {"filter", orNull(options.filter)},
        {"pageSize", orNull(options.page_size)},
        {"startCursor", orNull(options.start_cursor)}
    });

    return cached(key, config_.shortTtl(), [this, query, options]() {
        json body = {{"query", query}};
        if (options.filter) body["filter"] = *options.filter;
        if (options.page_size) body["page_size"] = *options.page_size;
        if (options.start_cursor) body["start_cursor"] = *options.start_cursor;
        return http_client_->request("POST", "/search", body);
    });
}

json NotionClient::listDatabases() {
    return cached(CacheKey::make("databases_list"), config_.shortTtl(), [this]() {
        SearchRequest options;
        options.filter = json{{"property", "object"}, {"value", "database"}};
        return search("", options);
    });
}

// --- Pages ---

json NotionClient::getPage(const std::string& page_id) {
    return cached(CacheKey::make("page", {{"id", page_id}}), config_.mediumTtl(), [this, page_id]() {
        return http_client_->request("GET", "/pages/" + page_id);
    });
}

json NotionClient::getBlocks(const std::string& block_id, const PageRequest& options) {
    std::string key = CacheKey::make("blocks", {
        {"id", block_id},
        {"startCursor", orNull(options.start_cursor)},
        {"pageSize", orNull(options.page_size)}
    });

    return cached(key, config_.mediumTtl(), [this, block_id, options]() {
        std::string query = Utils::buildQueryString({
            {"start_cursor", options.start_cursor},
            {"page_size", toQueryValue(options.page_size)}
        });
        return http_client_->request("GET", "/blocks/" + block_id + "/children" + query);
    });
}

json NotionClient::createPage(const PageParent& parent, const json& properties, const std::optional<json>& children) {
    json body = {{"parent", parent.to_json()}, {"properties", properties}};
    if (children) {
        body["children"] = *children;
    }
    json result = http_client_->request("POST", "/pages", body);

    invalidateOperation("search");
    if (parent.database_id) {
        invalidateMatching(
            CacheKey::mentionPattern(cache_->qualify("database_query"), CacheKey::encodeComponent(*parent.database_id)),
            "database_query/*" + *parent.database_id + "*");
    }
    return result;
}

json NotionClient::updatePage(const std::string& page_id, const json& properties, std::optional<bool> archived) {
    json body = {{"properties", properties}};
    if (archived) {
        body["archived"] = *archived;
    }
    json result = http_client_->request("PATCH", "/pages/" + page_id, body);

    cache_->invalidate(CacheKey::make("page", {{"id", page_id}}));
    invalidateOperation("search");
    invalidateOperation("database_query");
    return result;
}

json NotionClient::archivePage(const std::string& page_id) {
    json result = http_client_->request("PATCH", "/pages/" + page_id, json{{"archived", true}});

    cache_->invalidate(CacheKey::make("page", {{"id", page_id}}));
    invalidateOperation("search");
    invalidateOperation("database_query");
    return result;
}

// --- Databases ---

json NotionClient::getDatabase(const std::string& database_id) {
    return cached(CacheKey::make("database", {{"id", database_id}}), config_.mediumTtl(), [this, database_id]() {
        return http_client_->request("GET", "/databases/" + database_id);
    });
}

json NotionClient::queryDatabase(const std::string& database_id, const DatabaseQueryRequest& options) {
    std::string key = CacheKey::make("database_query", {
        {"id", database_id},
        {"filter", orNull(options.filter)},
        {"sorts", orNull(options.sorts)},
        {"pageSize", orNull(options.page_size)},
        {"startCursor", orNull(options.start_cursor)}
    });

    return cached(key, config_.shortTtl(), [this, database_id, options]() {
        json body = json::object();
        if (options.filter) body["filter"] = *options.filter;
        if (options.sorts) body["sorts"] = *options.sorts;
        if (options.page_size) body["page_size"] = *options.page_size;
        if (options.start_cursor) body["start_cursor"] = *options.start_cursor;
        return http_client_->request("POST", "/databases/" + database_id + "/query", body);
    });
}

json NotionClient::createDatabaseRow(const std::string& database_id, const json& properties) {
    PageParent parent;
    parent.database_id = database_id;
    return createPage(parent, properties);
}

// --- Blocks ---

json NotionClient::getBlock(const std::string& block_id) {
    return cached(CacheKey::make("block", {{"id", block_id}}), config_.mediumTtl(), [this, block_id]() {
        return http_client_->request("GET", "/blocks/" + block_id);
    });
}

json NotionClient::appendBlocks(const std::string& block_id, const json& children) {
    json result = http_client_->request("PATCH", "/blocks/" + block_id + "/children", json{{"children", children}});

    // Every page of the child listing is stale, not only the first one.
    invalidateMatching(CacheKey::paramPattern(cache_->qualify("blocks"), "id", block_id), "blocks/" + block_id);
    return result;
}

json NotionClient::deleteBlock(const std::string& block_id) {
    json result = http_client_->request("DELETE", "/blocks/" + block_id);

    cache_->invalidate(CacheKey::make("block", {{"id", block_id}}));
    invalidateMatching(
        CacheKey::mentionPattern(cache_->qualify("blocks"), CacheKey::encodeComponent(block_id)),
        "blocks/*" + block_id + "*");

    // The listing that contained the block is keyed by its parent.
    if (auto parent_id = parentIdOf(result)) {
        invalidateMatching(CacheKey::paramPattern(cache_->qualify("blocks"), "id", *parent_id), "blocks/" + *parent_id);
    } else {
        logger_->warn("Deleted block " + block_id + " has no parent in the response; parent listing left cached");
    }
    return result;
}

// --- Users ---

json NotionClient::listUsers(const PageRequest& options) {
    std::string key = CacheKey::make("users", {
        {"startCursor", orNull(options.start_cursor)},
        {"pageSize", orNull(options.page_size)}
    });

    return cached(key, config_.longTtl(), [this, options]() {
        std::string query = Utils::buildQueryString({
            {"start_cursor", options.start_cursor},
            {"page_size", toQueryValue(options.page_size)}
        });
        return http_client_->request("GET", "/users" + query);
    });
}

json NotionClient::getUser(const std::string& user_id) {
    return cached(CacheKey::make("user", {{"id", user_id}}), config_.longTtl(), [this, user_id]() {
        return http_client_->request("GET", "/users/" + user_id);
    });
}

json NotionClient::getSelf() {
    return cached(CacheKey::make("self"), config_.longTtl(), [this]() {
        return http_client_->request("GET", "/users/me");
    });
}

// --- Comments ---

json NotionClient::getComments(const CommentsRequest& options) {
    std::string key = CacheKey::make("comments", {
        {"blockId", orNull(options.block_id)},
        {"startCursor", orNull(options.start_cursor)},
        {"pageSize", orNull(options.page_size)}
    });

    return cached(key, config_.shortTtl(), [this, options]() {
        std::string query = Utils::buildQueryString({
            {"block_id", options.block_id},
            {"start_cursor", options.start_cursor},
            {"page_size", toQueryValue(options.page_size)}
        });
        return http_client_->request("GET", "/comments" + query);
    });
}

json NotionClient::createComment(const NewComment& comment) {
    json result = http_client_->request("POST", "/comments", comment.to_json());

    if (comment.page_id) {
        invalidateMatching(
            CacheKey::mentionPattern(cache_->qualify("comments"), CacheKey::encodeComponent(*comment.page_id)),
            "comments/*" + *comment.page_id + "*");
    }
    return result;
}
