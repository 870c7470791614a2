#include "tasks/download_task.hpp"
#include "common/errors.hpp"
#include "nlohmann/json.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string DownloadTask::file_path() const {
    return (fs::path(saved_dir) / file_name).string();
}

std::string DownloadTask::partial_path() const {
    return file_path() + PARTIAL_FILE_SUFFIX;
}

const char* to_string(DownloadTaskStatus status) {
    switch (status) {
        case DownloadTaskStatus::UNDEFINED: return "UNDEFINED";
        case DownloadTaskStatus::ENQUEUED: return "ENQUEUED";
        case DownloadTaskStatus::RUNNING: return "RUNNING";
        case DownloadTaskStatus::COMPLETE: return "COMPLETE";
        case DownloadTaskStatus::FAILED: return "FAILED";
        case DownloadTaskStatus::CANCELED: return "CANCELED";
        case DownloadTaskStatus::PAUSED: return "PAUSED";
    }
    return "UNKNOWN";
}

std::optional<DownloadTaskStatus> status_from_int(int value) {
    if (value < static_cast<int>(DownloadTaskStatus::UNDEFINED) ||
        value > static_cast<int>(DownloadTaskStatus::PAUSED)) {
        return std::nullopt;
    }
    return static_cast<DownloadTaskStatus>(value);
}

std::optional<DownloadTaskStatus> status_from_string(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (int i = 0; i <= static_cast<int>(DownloadTaskStatus::PAUSED); ++i) {
        auto status = static_cast<DownloadTaskStatus>(i);
        if (upper == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

bool is_terminal(DownloadTaskStatus status) {
    return status == DownloadTaskStatus::COMPLETE ||
           status == DownloadTaskStatus::FAILED ||
           status == DownloadTaskStatus::CANCELED;
}

bool is_active(DownloadTaskStatus status) {
    return status == DownloadTaskStatus::ENQUEUED ||
           status == DownloadTaskStatus::RUNNING ||
           status == DownloadTaskStatus::PAUSED;
}

std::optional<int> compute_progress(int64_t bytes_downloaded, int64_t bytes_total) {
    if (bytes_total <= 0) {
        return std::nullopt;
    }
    int64_t clamped = std::clamp<int64_t>(bytes_downloaded, 0, bytes_total);
    if (clamped == bytes_total) {
        return 100;
    }
    if (clamped <= std::numeric_limits<int64_t>::max() / 100) {
        return static_cast<int>(clamped * 100 / bytes_total);
    }
    // bytes * 100 overflows int64_t here; the 128-bit product is exact
    unsigned __int128 scaled = static_cast<unsigned __int128>(clamped) * 100u;
    return static_cast<int>(scaled / static_cast<unsigned __int128>(bytes_total));
}

std::string resolve_file_name(const std::string& url) {
    std::string path = url;
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto host_end = path.find('/', scheme + 3);
        path = host_end == std::string::npos ? std::string() : path.substr(host_end);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return "download";
    }
    return name;
}

std::string headers_to_json(const TaskHeaders& headers) {
    json j = json::object();
    for (const auto& [key, value] : headers) {
        j[key] = value;
    }
    return j.dump();
}

TaskHeaders headers_from_json(const std::string& json_text) {
    TaskHeaders headers;
    if (json_text.empty()) {
        return headers;
    }
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw PersistenceError(std::string("Stored headers are not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw PersistenceError("Stored headers are not a JSON object");
    }
    for (auto& [key, value] : j.items()) {
        headers[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return headers;
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
