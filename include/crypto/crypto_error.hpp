#ifndef GUIDSTORE_CRYPTO_ERROR_HPP
#define GUIDSTORE_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace guidstore::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class InvalidArgumentError : public CryptoError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : CryptoError("Invalid argument: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Decryption error: " + message) {}
};

} // namespace guidstore::crypto

#endif // GUIDSTORE_CRYPTO_ERROR_HPP
