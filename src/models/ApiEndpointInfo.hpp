#pragma once

#include <string>

// Where the remote workspace API lives, parsed from a base URL such as
// https://api.notion.com/v1
struct ApiEndpointInfo {
    std::string url;
    std::string host;
    int port = 443;
    std::string base_path;
    bool is_https = true;

    bool operator==(const ApiEndpointInfo& other) const {
        return url == other.url;
    }

    // Request target for an endpoint relative to the API base, e.g. "/pages/abc".
    std::string target(const std::string& endpoint) const {
        return base_path + endpoint;
    }
};
