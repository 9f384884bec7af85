#pragma once
#include <stdexcept>
#include <string>

namespace itemstore {

// Malformed client input (path parameter or request body); maps to 400
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No row matches the requested id; maps to 404
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Failure reported by the embedded database; maps to 500
class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& message, int code = 0)
        : std::runtime_error(message), code_(code) {}

    // SQLite extended result code, 0 when not applicable
    int code() const { return code_; }
    bool is_constraint_violation() const;

private:
    int code_;
};

// The service cannot be brought up (store unreachable, schema creation failed)
class StartupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace itemstore
