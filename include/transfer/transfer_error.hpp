#ifndef FTECHO_TRANSFER_ERROR_HPP
#define FTECHO_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ftecho {
namespace transfer {

// Base for operation-level failures that are not storage failures
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error(message) {}
};

// Payload of an operation frame could not be parsed
class InvalidRequestError : public TransferError {
public:
    explicit InvalidRequestError(const std::string& message)
        : TransferError("Invalid request: " + message) {}
};

// Received byte count disagrees with the declared size
class SizeMismatchError : public TransferError {
public:
    SizeMismatchError(unsigned long long declared, unsigned long long received)
        : TransferError("Size mismatch: declared " + std::to_string(declared) +
                        " bytes, received " + std::to_string(received)) {}
};

// Two digests of the same logical file disagree
class ChecksumMismatchError : public TransferError {
public:
    ChecksumMismatchError(const std::string& local, const std::string& remote)
        : TransferError("Checksum mismatch: local=" + local + ", remote=" + remote) {}
};

// A well-formed frame arrived where the operation expected another type
class UnexpectedFrameError : public TransferError {
public:
    explicit UnexpectedFrameError(const std::string& message)
        : TransferError("Unexpected frame: " + message) {}
};

} // namespace transfer
} // namespace ftecho

#endif // FTECHO_TRANSFER_ERROR_HPP
