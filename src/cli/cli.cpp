#include "cli/cli.hpp"
#include "common/errors.hpp"

#include <iomanip>
#include <sstream>

CLI::CLI(Downloader& downloader, std::istream& in, std::ostream& out)
    : downloader_(downloader), in_(in), out_(out), running_(false) {}

void CLI::run() {
    running_ = true;
    downloader_.register_callback(
        [this](const std::string& id, DownloadTaskStatus status, int progress) {
            std::lock_guard<std::mutex> lock(out_mutex_);
            out_ << "[" << id << "] " << to_string(status) << " " << progress << "%" << std::endl;
        },
        downloader_.config().callback_step);
    print_help();

    std::string line;
    while (running_ && std::getline(in_, line)) {
        if (line.empty()) continue;
        handle_command(line);
    }
}

void CLI::print_help() {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << "Available commands:\n"
         << "  enqueue <url> <dir> [file_name] - Queue a download\n"
         << "  list                            - List all tasks\n"
         << "  query <sql>                     - List tasks matching a SELECT on table 'task'\n"
         << "  pause <id>                      - Pause a running task\n"
         << "  resume <id>                     - Continue a paused task under a new id\n"
         << "  retry <id>                      - Restart a failed or canceled task under a new id\n"
         << "  cancel <id>                     - Cancel a task\n"
         << "  cancel_all                      - Cancel every active task\n"
         << "  remove <id> [--delete]          - Forget a task, optionally deleting its file\n"
         << "  open <id>                       - Open a completed download\n"
         << "  help                            - Show this help\n"
         << "  quit / exit                     - Exit\n"
         << std::endl;
}

void CLI::handle_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) args.push_back(arg);

    try {
        if (cmd == "enqueue") cmd_enqueue(args);
        else if (cmd == "list") cmd_list(args);
        else if (cmd == "query") cmd_query(line.substr(line.find("query") + 5));
        else if (cmd == "pause") cmd_pause(args);
        else if (cmd == "resume") cmd_resume(args);
        else if (cmd == "retry") cmd_retry(args);
        else if (cmd == "cancel") cmd_cancel(args);
        else if (cmd == "cancel_all") downloader_.cancel_all();
        else if (cmd == "remove") cmd_remove(args);
        else if (cmd == "open") cmd_open(args);
        else if (cmd == "help") print_help();
        else if (cmd == "quit" || cmd == "exit") running_ = false;
        else {
            std::lock_guard<std::mutex> lock(out_mutex_);
            out_ << "Unknown command: " << cmd << std::endl;
        }
    } catch (const DownloaderError& e) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << "Error: " << e.what() << std::endl;
    }
}

void CLI::print_tasks(const std::vector<DownloadTask>& tasks) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (tasks.empty()) {
        out_ << "No tasks." << std::endl;
        return;
    }
    for (const auto& task : tasks) {
        out_ << task.task_id << "  " << std::left << std::setw(9) << to_string(task.status) << std::right
             << std::setw(4) << task.progress << "%  " << task.file_path();
        if (task.superseded()) {
            out_ << "  (continued as " << task.superseded_by << ")";
        } else if (task.resumable) {
            out_ << "  (resumable)";
        }
        if (!task.error_message.empty()) {
            out_ << "  error: " << task.error_message;
        }
        out_ << std::endl;
    }
}

void CLI::cmd_enqueue(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << "Usage: enqueue <url> <dir> [file_name]" << std::endl;
        return;
    }
    EnqueueRequest request;
    request.url = args[0];
    request.saved_dir = args[1];
    if (args.size() > 2) {
        request.file_name = args[2];
    }
    std::string id = downloader_.enqueue(request);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << "Enqueued task " << id << std::endl;
}

void CLI::cmd_list(const std::vector<std::string>&) {
    print_tasks(downloader_.load_tasks());
}

void CLI::cmd_query(const std::string& sql) {
    if (sql.find_first_not_of(" \t") == std::string::npos) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << "Usage: query <sql>, e.g. query SELECT * FROM task WHERE status=3" << std::endl;
        return;
    }
    print_tasks(downloader_.load_tasks_with_raw_query(sql));
}

void CLI::cmd_pause(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << "Usage: pause <id>" << std::endl;
        return;
    }
    downloader_.pause(args[0]);
}

void CLI::cmd_resume(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << "Usage: resume <id>" << std::endl;
        return;
    }
    std::string id = downloader_.resume(args[0]);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << "Resumed as task " << id << std::endl;
}

void CLI::cmd_retry(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << "Usage: retry <id>" << std::endl;
        return;
    }
    std::string id = downloader_.retry(args[0]);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << "Retrying as task " << id << std::endl;
}

void CLI::cmd_cancel(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << "Usage: cancel <id>" << std::endl;
        return;
    }
    downloader_.cancel(args[0]);
}

void CLI::cmd_remove(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << "Usage: remove <id> [--delete]" << std::endl;
        return;
    }
    bool delete_content = args.size() > 1 && args[1] == "--delete";
    downloader_.remove(args[0], delete_content);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << "Removed " << args[0] << std::endl;
}

void CLI::cmd_open(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << "Usage: open <id>" << std::endl;
        return;
    }
    bool opened = downloader_.open(args[0]);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << (opened ? "Opened " : "Could not open ") << args[0] << std::endl;
}
