#ifndef GUIDSTORE_STORE_ERROR_HPP
#define GUIDSTORE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace guidstore::store {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid construction arguments (empty path, zero interval, bad key text)
class ConfigurationError : public StoreError {
public:
    explicit ConfigurationError(const std::string& message)
        : StoreError("Configuration error: " + message) {}
};

// Backing file or directory could not be opened, created or written
class StoreIOError : public StoreError {
public:
    explicit StoreIOError(const std::string& message)
        : StoreError("I/O error: " + message) {}
};

class StoreDisposedError : public StoreError {
public:
    explicit StoreDisposedError(const std::string& message)
        : StoreError("Store disposed: " + message) {}
};

// Entry exists but cannot be interpreted as the requested type
class PayloadError : public StoreError {
public:
    explicit PayloadError(const std::string& message)
        : StoreError("Malformed payload: " + message) {}
};

} // namespace guidstore::store

#endif // GUIDSTORE_STORE_ERROR_HPP
