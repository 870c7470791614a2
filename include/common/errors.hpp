#ifndef DLR_ERRORS_HPP
#define DLR_ERRORS_HPP

#include <stdexcept>
#include <string>

// Base class for every error the downloader reports to its callers.
class DownloaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad input: relative or missing directory, out-of-range step, malformed query.
class ValidationError : public DownloaderError {
public:
    using DownloaderError::DownloaderError;
};

// Command not valid for the task's current status.
class InvalidStateError : public DownloaderError {
public:
    using DownloaderError::DownloaderError;
};

// SQLite failure. The durable state is unchanged by the failed call.
class PersistenceError : public DownloaderError {
public:
    using DownloaderError::DownloaderError;
};

class NotFoundError : public DownloaderError {
public:
    explicit NotFoundError(const std::string& task_id)
        : DownloaderError("Unknown task id: " + task_id), task_id_(task_id) {}

    const std::string& task_id() const { return task_id_; }

private:
    std::string task_id_;
};

// Transfer-layer failure. Raised inside an executor and reported as a FAILED
// task event, never thrown to command callers.
class ExecutorError : public DownloaderError {
public:
    using DownloaderError::DownloaderError;
};

#endif // DLR_ERRORS_HPP
