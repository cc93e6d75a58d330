#ifndef GUIDSTORE_CONFIG_ERROR_HPP
#define GUIDSTORE_CONFIG_ERROR_HPP

#include <stdexcept>
#include <string>

namespace guidstore::config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration file error: " + message) {}
};

} // namespace guidstore::config

#endif // GUIDSTORE_CONFIG_ERROR_HPP
