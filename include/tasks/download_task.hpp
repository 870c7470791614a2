#ifndef DLR_DOWNLOAD_TASK_HPP
#define DLR_DOWNLOAD_TASK_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>

// Persisted as integers; the values are part of the raw query surface
// ("SELECT * FROM task WHERE status=3").
enum class DownloadTaskStatus : int {
    UNDEFINED = 0,
    ENQUEUED = 1,
    RUNNING = 2,
    COMPLETE = 3,
    FAILED = 4,
    CANCELED = 5,
    PAUSED = 6
};

using TaskHeaders = std::map<std::string, std::string>;

// Sentinel for a total size the executor has not reported yet.
constexpr int64_t UNKNOWN_TOTAL_BYTES = -1;

// Suffix of the partial artifact written next to the final file.
constexpr const char* PARTIAL_FILE_SUFFIX = ".part";

struct DownloadTask {
    std::string task_id;
    DownloadTaskStatus status = DownloadTaskStatus::UNDEFINED;
    int progress = 0;
    std::string url;
    std::string file_name;
    std::string saved_dir;
    TaskHeaders headers;
    bool resumable = false;
    bool show_notification = true;
    bool open_file_from_notification = true;
    bool requires_storage_not_low = true;
    bool save_in_public_storage = false;
    int64_t time_created = 0; // ms since epoch
    int64_t bytes_downloaded = 0;
    int64_t bytes_total = UNKNOWN_TOTAL_BYTES;
    std::string partial_file;
    std::string superseded_by;
    std::string error_message;

    std::string file_path() const;
    std::string partial_path() const;
    bool superseded() const { return !superseded_by.empty(); }
};

// Parameters of a new download request.
struct EnqueueRequest {
    std::string url;
    std::string saved_dir;
    std::optional<std::string> file_name;
    TaskHeaders headers;
    bool show_notification = true;
    bool open_file_from_notification = true;
    bool requires_storage_not_low = true;
    bool save_in_public_storage = false;
};

const char* to_string(DownloadTaskStatus status);
std::optional<DownloadTaskStatus> status_from_int(int value);
std::optional<DownloadTaskStatus> status_from_string(const std::string& name);

bool is_terminal(DownloadTaskStatus status);
// ENQUEUED, RUNNING or PAUSED
bool is_active(DownloadTaskStatus status);

// floor(bytes * 100 / total) clamped to 0..100, or nullopt while the total is unknown.
std::optional<int> compute_progress(int64_t bytes_downloaded, int64_t bytes_total);

// Last path segment of the URL without query or fragment, or "download".
std::string resolve_file_name(const std::string& url);

std::string headers_to_json(const TaskHeaders& headers);
TaskHeaders headers_from_json(const std::string& json_text);

int64_t now_millis();

#endif // DLR_DOWNLOAD_TASK_HPP
