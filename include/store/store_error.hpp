#ifndef FTECHO_STORE_ERROR_HPP
#define FTECHO_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ftecho {
namespace store {

// Base for every storage failure. All of them are recoverable at the
// operation level and reach the peer as a single E frame.
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidFilenameError : public StoreError {
public:
  explicit InvalidFilenameError(const std::string& message)
    : StoreError("Invalid filename: " + message) {}
};

class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const std::string& filename)
    : StoreError("File not found: " + filename) {}
};

class OffsetMismatchError : public StoreError {
public:
  OffsetMismatchError(unsigned long long actual, unsigned long long claimed)
    : StoreError("Offset mismatch: expected " + std::to_string(actual) +
                 ", got " + std::to_string(claimed)) {}
};

class BusyError : public StoreError {
public:
  explicit BusyError(const std::string& filename)
    : StoreError("Busy: another upload of " + filename + " is in progress") {}
};

class IOFailureError : public StoreError {
public:
  explicit IOFailureError(const std::string& message)
    : StoreError("I/O failure: " + message) {}
};

} // namespace store
} // namespace ftecho

#endif // FTECHO_STORE_ERROR_HPP
