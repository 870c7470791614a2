#ifndef DLR_CLI_HPP
#define DLR_CLI_HPP

#include <istream>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "../api/downloader.hpp"

// Interactive shell over a Downloader. Reads commands line by line.
class CLI {
public:
    CLI(Downloader& downloader, std::istream& in, std::ostream& out);

    void run();
    void handle_command(const std::string& line);
    bool running() const { return running_; }

private:
    void print_help();
    void print_tasks(const std::vector<DownloadTask>& tasks);

    void cmd_enqueue(const std::vector<std::string>& args);
    void cmd_list(const std::vector<std::string>& args);
    void cmd_query(const std::string& sql);
    void cmd_pause(const std::vector<std::string>& args);
    void cmd_resume(const std::vector<std::string>& args);
    void cmd_retry(const std::vector<std::string>& args);
    void cmd_cancel(const std::vector<std::string>& args);
    void cmd_remove(const std::vector<std::string>& args);
    void cmd_open(const std::vector<std::string>& args);

    Downloader& downloader_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex out_mutex_;
    bool running_;
};

#endif // DLR_CLI_HPP
