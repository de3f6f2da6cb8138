#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// One authenticated JSON request against the workspace API.
// method is an HTTP verb ("GET", "POST", "PATCH", "DELETE"), endpoint is
// relative to the API base ("/pages/abc"). Returns the parsed response body.
// Throws ApiError for non-2xx answers and TransportError when no answer arrived.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual nlohmann::json request(const std::string& method,
                                   const std::string& endpoint,
                                   const std::optional<nlohmann::json>& body = std::nullopt) = 0;
};
