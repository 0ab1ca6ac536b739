#pragma once

#include <stdexcept>
#include <string>

/**
 * Requested category key is not part of the CategoryMap.
 * Permanent: retrying the same request can never succeed.
 */
class UnknownCategoryError : public std::runtime_error
{
public:
    explicit UnknownCategoryError(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Base class for everything that can abort a single transfer attempt.
 */
class TransferError : public std::runtime_error
{
public:
    explicit TransferError(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Connection failure, timeout or non-2xx HTTP status.
 */
class NetworkError : public TransferError
{
public:
    explicit NetworkError(const std::string &message, long httpStatus = 0)
        : TransferError(message), httpStatus_(httpStatus) {}

    // 0 when no HTTP response was received
    long httpStatus() const { return httpStatus_; }

private:
    long httpStatus_;
};

/**
 * Cannot create a directory, open, write or rename a file.
 */
class FilesystemError : public TransferError
{
public:
    explicit FilesystemError(const std::string &message)
        : TransferError(message) {}
};

/**
 * Transfer stopped because the caller raised the cancellation flag.
 * Only the .part file is left behind.
 */
class TransferCancelledError : public TransferError
{
public:
    explicit TransferCancelledError(const std::string &message)
        : TransferError(message) {}
};
