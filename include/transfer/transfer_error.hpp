#ifndef DISTORE_TRANSFER_ERROR_HPP
#define DISTORE_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace distore::transfer {

class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error(message) {}
};

// Local read or write failure
class IoError : public TransferError {
public:
    explicit IoError(const std::string& message)
        : TransferError(message) {}
};

// Record content that cannot be decoded
class MalformedRecord : public TransferError {
public:
    explicit MalformedRecord(const std::string& message)
        : TransferError(message) {}
};

// Well-formed record that cannot serve the requested operation
class InvalidRecord : public TransferError {
public:
    explicit InvalidRecord(const std::string& message)
        : TransferError(message) {}
};

// The progress consumer went away and the transfer was abandoned
class TransferAborted : public TransferError {
public:
    explicit TransferAborted(const std::string& message)
        : TransferError(message) {}
};

} // namespace distore::transfer

#endif // DISTORE_TRANSFER_ERROR_HPP
