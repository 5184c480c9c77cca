//
// Failures raised inside the client layer. They are caught at the operation boundary and turned into
// notifications plus an empty result, only the "await or fail" transport variant lets them escape.
//

#ifndef LRR_CLIENT_ERRORS_H
#define LRR_CLIENT_ERRORS_H

#include <stdexcept>
#include <string>

// DNS, socket or timeout failure reported by the transport
class eTransportError : public std::runtime_error {
public:
    explicit eTransportError(const std::string& cause) : std::runtime_error(cause) {}
};

// The server answered with a non 2xx status
class eServerError : public std::runtime_error {
public:
    explicit eServerError(int statusCode)
            : std::runtime_error("Server responded with status " + std::to_string(statusCode)), statusCode_(statusCode) {}

    [[nodiscard]] auto statusCode() const -> int { return statusCode_; }

private:
    int statusCode_;
};

// The server answered 2xx but the body carries an explicit error
class eApplicationError : public std::runtime_error {
public:
    explicit eApplicationError(const std::string& error) : std::runtime_error(error) {}
};

// The awaiting task was cancelled. Never reported to the user.
class eCancelled : public std::exception {
public:
    [[nodiscard]] auto what() const noexcept -> const char* override { return "Operation cancelled"; }
};

#endif //LRR_CLIENT_ERRORS_H
