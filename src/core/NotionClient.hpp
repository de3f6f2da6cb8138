#ifndef NOTIONCLIENT_HPP
#define NOTIONCLIENT_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "../cache/FetchCoordinator.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/IHttpClient.hpp"
#include "../interfaces/ILogger.hpp"
#include "../models/CacheStats.hpp"
#include "../models/NotionRequests.hpp"

using json = nlohmann::json;

// Workspace API wrappers. Reads go through the cache with a per-operation TTL
// tier; writes go straight to the API and, once they succeed, drop the cached
// reads they made stale.
class NotionClient {
public:
    NotionClient(const AppConfig& config,
                 std::shared_ptr<CacheInterface> cache,
                 std::shared_ptr<IHttpClient> http_client,
                 std::shared_ptr<ILogger> logger)
        : config_(config),
          cache_(cache),
          http_client_(http_client),
          logger_(logger) {
        if (!cache_) {
            throw std::invalid_argument("Cache pointer cannot be null");
        }
        if (!http_client_) {
            throw std::invalid_argument("HttpClient pointer cannot be null");
        }
        if (!logger_) {
            throw std::invalid_argument("Logger pointer cannot be null");
        }
        fetcher_ = std::make_unique<FetchCoordinator>(cache_, logger_);
        if (!config_.cache_enabled) {
            disableCache();
        }
        logger_->debug("NotionClient initialized");
    }

    virtual ~NotionClient() = default;

    NotionClient(const NotionClient&) = delete;
    NotionClient& operator=(const NotionClient&) = delete;
    NotionClient(NotionClient&&) = delete;
    NotionClient& operator=(NotionClient&&) = delete;

    // --- Cache Control ---
    void disableCache();
    void enableCache();
    bool isCacheDisabled() const { return cache_disabled_.load(); }
    CacheStats getCacheStats() const;
    size_t clearCache();
    // key is the unqualified cache key, e.g. "page:id=abc"
    bool invalidateCacheKey(const std::string& key);

    // --- Search ---
    json search(const std::string& query, const SearchRequest& options = {});
    json listDatabases();

    // --- Pages ---
    json getPage(const std::string& page_id);
    json getBlocks(const std::string& block_id, const PageRequest& options = {});
    json createPage(const PageParent& parent, const json& properties,
                    const std::optional<json>& children = std::nullopt);
    json updatePage(const std::string& page_id, const json& properties,
                    std::optional<bool> archived = std::nullopt);
    json archivePage(const std::string& page_id);

    // --- Databases ---
    json getDatabase(const std::string& database_id);
    json queryDatabase(const std::string& database_id, const DatabaseQueryRequest& options = {});
    json createDatabaseRow(const std::string& database_id, const json& properties);

    // --- Blocks ---
    json getBlock(const std::string& block_id);
    json appendBlocks(const std::string& block_id, const json& children);
    json deleteBlock(const std::string& block_id);

    // --- Users ---
    json listUsers(const PageRequest& options = {});
    json getUser(const std::string& user_id);
    json getSelf();

    // --- Comments ---
    json getComments(const CommentsRequest& options);
    json createComment(const NewComment& comment);

private:
    json cached(const std::string& key, std::chrono::milliseconds ttl, const FetchCoordinator::Producer& producer);
    size_t invalidateMatching(const std::regex& pattern, const std::string& description);
    size_t invalidateOperation(const std::string& operation);

    const AppConfig& config_;
    std::shared_ptr<CacheInterface> cache_;
    std::shared_ptr<IHttpClient> http_client_;
    std::shared_ptr<ILogger> logger_;
    std::unique_ptr<FetchCoordinator> fetcher_;
    std::atomic<bool> cache_disabled_{false};
};

#endif // NOTIONCLIENT_HPP
