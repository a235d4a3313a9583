#include "process.hpp"
#include "../errors.hpp"

#include <atomic>
#include <cstdint>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stmt {
namespace fs = std::filesystem;

std::string find_executable(const std::string& command) {
    if (command.empty()) return "";
    if (command.find('/') != std::string::npos) {
        return ::access(command.c_str(), X_OK) == 0 ? command : "";
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / command;
        std::error_code ec;
        if (fs::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

int spawn_to_file(const std::string& executable,
                  const std::vector<std::string>& args,
                  const std::string& output_path) {
    const int out_fd = ::open(output_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0600);
    if (out_fd < 0) return -1;

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(out_fd);
        return -1;
    }

    if (pid == 0) {
        const int dev_null = ::open("/dev/null", O_WRONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDERR_FILENO);
            ::close(dev_null);
        }
        if (::dup2(out_fd, STDOUT_FILENO) < 0) {
            _exit(127);
        }
        ::close(out_fd);

        std::vector<char*> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        ::execv(executable.c_str(), argv.data());
        _exit(127);
    }

    ::close(out_fd);
    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

TempFile::TempFile(const std::string& suffix) {
    static std::atomic<uint64_t> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = (fs::temp_directory_path() /
        ("stmt_ingest_" + std::to_string(::getpid()) + "_" +
         std::to_string(stamp) + "_" + std::to_string(counter++) + suffix)).string();
}

TempFile::~TempFile() {
    std::error_code ec;
    fs::remove(path_, ec);
}

void TempFile::write(const std::vector<char>& bytes) const {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) throw FormatError("Cannot create temp file " + path_);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw FormatError("Cannot write temp file " + path_);
}

std::string TempFile::read() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in) return "";
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace stmt
