#ifndef DLR_FILE_SYSTEM_HPP
#define DLR_FILE_SYSTEM_HPP

#include <string>

// Filesystem operations the task controller needs. Mocked in tests.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool directory_exists(const std::string& path) const = 0;
    virtual bool is_absolute(const std::string& path) const = 0;
    virtual bool file_exists(const std::string& path) const = 0;
    // Returns true if the file existed and was removed
    virtual bool delete_file(const std::string& path) = 0;
    // Hands the file to the platform viewer. Returns false if that failed.
    virtual bool open_file(const std::string& path) = 0;
    // Shared download location used for save_in_public_storage requests
    virtual std::string public_directory() const = 0;
};

class LocalFileSystem : public FileSystem {
public:
    explicit LocalFileSystem(std::string opener_command);

    bool directory_exists(const std::string& path) const override;
    bool is_absolute(const std::string& path) const override;
    bool file_exists(const std::string& path) const override;
    bool delete_file(const std::string& path) override;
    bool open_file(const std::string& path) override;
    std::string public_directory() const override;

private:
    std::string opener_command_;
};

#endif // DLR_FILE_SYSTEM_HPP
