#pragma once
// Child-process helpers for the external document converters
#include <string>
#include <vector>

namespace stmt {

// Absolute path of an executable found on PATH, or "" when missing.
// A command containing '/' is checked as given.
std::string find_executable(const std::string& command);

// Runs executable with args, stdout redirected into output_path and stderr
// discarded. Returns the exit code, or -1 when the child could not be run.
int spawn_to_file(const std::string& executable,
                  const std::vector<std::string>& args,
                  const std::string& output_path);

// Scratch file under the system temp dir, removed on destruction
class TempFile {
public:
    explicit TempFile(const std::string& suffix);
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::string& path() const { return path_; }

    // Throws FormatError when the file cannot be written
    void write(const std::vector<char>& bytes) const;
    [[nodiscard]] std::string read() const;

private:
    std::string path_;
};

} // namespace stmt
