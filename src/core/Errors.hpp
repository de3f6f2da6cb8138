#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// The remote API answered with a non-2xx status.
class ApiError : public std::runtime_error {
public:
    ApiError(int status, const std::string& body)
        : std::runtime_error("Notion API error (" + std::to_string(status) + "): " + body),
          status_(status),
          body_(body) {}

    int status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    int status_;
    std::string body_;
};

// No usable response: resolve, connect, TLS, read/write failure or timeout.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad command line input.
class CommandError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#endif // ERRORS_HPP
