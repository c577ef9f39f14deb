#ifndef FTECHO_CRYPTO_ERROR_HPP
#define FTECHO_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ftecho::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message) 
        : CryptoError("Initialization error: " + message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message) 
        : CryptoError("Digest error: " + message) {}
};

} // namespace ftecho::crypto

#endif // FTECHO_CRYPTO_ERROR_HPP
