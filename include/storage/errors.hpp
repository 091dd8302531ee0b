#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace caskdb::storage {

/**
 * Base class for every failure raised by the storage layer.
 */
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Codec-level parse failures
class MalformedHeader : public StorageError {
public:
    using StorageError::StorageError;
};

class MalformedRecord : public StorageError {
public:
    using StorageError::StorageError;
};

// Raised while loading when the log cannot be parsed up to EOF
class CorruptLog : public StorageError {
public:
    CorruptLog(const std::string& what, std::uint64_t offset)
        : StorageError(what), offset_(offset) {}

    std::uint64_t offset() const { return offset_; }

private:
    std::uint64_t offset_;
};

// The KeyDir points at bytes that do not decode to the expected record
class IndexCorruption : public StorageError {
public:
    using StorageError::StorageError;
};

class IOFailure : public StorageError {
public:
    IOFailure(const std::string& what, int error_code)
        : StorageError(what), error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

class ClosedEngine : public StorageError {
public:
    ClosedEngine() : StorageError("Operation on closed store") {}
};

} // namespace caskdb::storage
