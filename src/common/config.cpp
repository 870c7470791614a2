#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "nlohmann/json.hpp"

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

template<typename T>
void read_optional(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(target);
    }
}

} // namespace

// JSON deserialization for the config structs; missing keys keep defaults
void from_json(const json& j, ExecutorConfig& c) {
    read_optional(j, "worker_threads", c.worker_threads);
    read_optional(j, "chunk_size", c.chunk_size);
    read_optional(j, "max_rate_bytes_per_sec", c.max_rate_bytes_per_sec);
    read_optional(j, "ack_timeout_ms", c.ack_timeout_ms);
}

void from_json(const json& j, DownloaderConfig& c) {
    read_optional(j, "database", c.database);
    read_optional(j, "log_file", c.log_file);
    read_optional(j, "debug", c.debug);
    read_optional(j, "ignore_ssl", c.ignore_ssl);
    read_optional(j, "callback_step", c.callback_step);
    read_optional(j, "event_queue_capacity", c.event_queue_capacity);
    read_optional(j, "recover_interrupted", c.recover_interrupted);
    read_optional(j, "opener_command", c.opener_command);
    read_optional(j, "executor", c.executor);
}

void DownloaderConfig::validate() const {
    if (database.empty()) {
        throw ValidationError("config: database path must not be empty");
    }
    if (callback_step < 0 || callback_step > 100) {
        throw ValidationError("config: callback_step must be in 0..100, got " + std::to_string(callback_step));
    }
    if (event_queue_capacity == 0) {
        throw ValidationError("config: event_queue_capacity must be positive");
    }
    if (executor.worker_threads == 0) {
        throw ValidationError("config: executor.worker_threads must be positive");
    }
    if (executor.chunk_size == 0) {
        throw ValidationError("config: executor.chunk_size must be positive");
    }
    if (executor.ack_timeout_ms <= 0) {
        throw ValidationError("config: executor.ack_timeout_ms must be positive");
    }
}

DownloaderConfig parse_config(const std::string& json_text) {
    DownloaderConfig config;
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("config: invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ValidationError("config: top-level value must be an object");
    }
    try {
        j.get_to(config);
    } catch (const json::exception& e) {
        throw ValidationError(std::string("config: ") + e.what());
    }
    config.validate();
    return config;
}

DownloaderConfig load_config(const std::string& config_path) {
    std::ifstream read_file(config_path);
    if (!read_file.is_open()) {
        LOG_INFO("No config file found at ", config_path, ". Using defaults.");
        return DownloaderConfig{};
    }

    std::stringstream buffer;
    buffer << read_file.rdbuf();
    std::string text = buffer.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return DownloaderConfig{};
    }

    try {
        json::parse(text);
    } catch (const json::parse_error& e) {
        LOG_WARN("Could not parse config file ", config_path, ". Using defaults. Error: ", e.what());
        return DownloaderConfig{};
    }
    return parse_config(text);
}
