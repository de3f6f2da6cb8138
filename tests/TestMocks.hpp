// tests/TestMocks.hpp
#pragma once

#include <chrono>
#include <optional>
#include <regex>
#include <string>

#include "gmock/gmock.h"

#include <nlohmann/json.hpp>

#include "../src/interfaces/CacheInterface.hpp"
#include "../src/interfaces/IHttpClient.hpp"
#include "../src/interfaces/ILogger.hpp"

using json = nlohmann::json;

// --- Mock Logger ---
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(int, getLogLevel, (), (override));
    MOCK_METHOD(bool, isDebugEnabled, (), (override));
};

// --- Mock Cache ---
class MockCache : public CacheInterface {
public:
    MOCK_METHOD(void, set, (const std::string& key, const json& value, std::chrono::milliseconds ttl), (override));
    MOCK_METHOD(std::optional<json>, get, (const std::string& key), (override));
    MOCK_METHOD(bool, exists, (const std::string& key), (override));
    MOCK_METHOD(bool, invalidate, (const std::string& key), (override));
    MOCK_METHOD(size_t, invalidatePattern, (const std::regex& pattern), (override));
    MOCK_METHOD(size_t, invalidateIf, (const KeyPredicate& predicate), (override));
    MOCK_METHOD(size_t, clear, (), (override));
    MOCK_METHOD(CacheStats, getStats, (), (const, override));
    MOCK_METHOD(void, resetStats, (), (override));
    MOCK_METHOD(void, enable, (), (override));
    MOCK_METHOD(void, disable, (), (override));
    MOCK_METHOD(bool, isEnabled, (), (const, override));
    MOCK_METHOD(std::string, qualify, (const std::string& key), (const, override));
};

// --- Mock HTTP Client ---
class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(json, request,
                (const std::string& method, const std::string& endpoint, const std::optional<json>& body),
                (override));
};

// Logger that accepts every call and reports debug as disabled.
inline std::shared_ptr<::testing::NiceMock<MockLogger>> makeQuietLogger() {
    auto logger = std::make_shared<::testing::NiceMock<MockLogger>>();
    ON_CALL(*logger, isDebugEnabled()).WillByDefault(::testing::Return(false));
    ON_CALL(*logger, getLogLevel()).WillByDefault(::testing::Return(3));
    return logger;
}

// Manually advanced clock for TTL tests.
struct FakeClock {
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);

    void advance(std::chrono::milliseconds delta) { now += delta; }
};
