#ifndef DLR_CONFIG_HPP
#define DLR_CONFIG_HPP

#include <cstddef>
#include <string>

struct ExecutorConfig {
    size_t worker_threads = 2;
    size_t chunk_size = 64 * 1024;
    size_t max_rate_bytes_per_sec = 0; // 0 = unlimited
    // How long pause/cancel may stay unacknowledged before the task is forced
    // into a terminal state.
    long ack_timeout_ms = 5000;
};

struct DownloaderConfig {
    // The default path for the config file.
    static constexpr const char* DEFAULT_CONFIG_FILE = "dlr.json";

    std::string database = "downloads.db";
    std::string log_file = "dlr.log";
    bool debug = false;
    bool ignore_ssl = false;
    int callback_step = 10;
    size_t event_queue_capacity = 1024;
    bool recover_interrupted = true;
    std::string opener_command = "xdg-open";
    ExecutorConfig executor;

    // Throws ValidationError when a value is out of range.
    void validate() const;
};

/**
 * @brief Loads the configuration from a JSON file.
 * @param config_path Path of the file. A missing file yields the defaults.
 * @return The parsed and validated configuration.
 */
DownloaderConfig load_config(const std::string& config_path);

// Parses a JSON document. Throws ValidationError on malformed input.
DownloaderConfig parse_config(const std::string& json_text);

#endif // DLR_CONFIG_HPP
