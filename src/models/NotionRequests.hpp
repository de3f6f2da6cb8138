#ifndef NOTIONREQUESTS_HPP
#define NOTIONREQUESTS_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Pagination shared by every listing endpoint.
struct PageRequest {
    std::optional<std::string> start_cursor;
    std::optional<int> page_size;
};

struct SearchRequest {
    std::optional<json> filter;   // e.g. {"property": "object", "value": "database"}
    std::optional<int> page_size;
    std::optional<std::string> start_cursor;
};

struct DatabaseQueryRequest {
    std::optional<json> filter;
    std::optional<json> sorts;    // array of sort objects
    std::optional<int> page_size;
    std::optional<std::string> start_cursor;
};

struct CommentsRequest {
    std::optional<std::string> block_id;
    std::optional<std::string> start_cursor;
    std::optional<int> page_size;
};

// Exactly one of the two ids is expected to be set.
struct PageParent {
    std::optional<std::string> database_id;
    std::optional<std::string> page_id;

    json to_json() const {
        json parent = json::object();
        if (database_id) parent["database_id"] = *database_id;
        if (page_id) parent["page_id"] = *page_id;
        return parent;
    }
};

struct NewComment {
    std::optional<std::string> page_id;
    std::optional<std::string> discussion_id;
    json rich_text = json::array();

    json to_json() const {
        json body = json::object();
        if (page_id) body["parent"] = {{"page_id", *page_id}};
        if (discussion_id) body["discussion_id"] = *discussion_id;
        body["rich_text"] = rich_text;
        return body;
    }
};

#endif // NOTIONREQUESTS_HPP
