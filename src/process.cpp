#include "process.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace {

// Owns a file descriptor, closes it on scope exit
class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    void reset(int fd = -1) {
        if (fd_ != -1) close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

void make_pipe(FdGuard& read_end, FdGuard& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw UpdchkException(string_format("error.pipe_failed", std::string(strerror(errno))));
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
}

} // anonymous namespace

std::string find_executable(const std::string& command) {
    if (command.empty()) return {};
    if (command.find('/') != std::string::npos) {
        return is_executable_file(command) ? command : std::string();
    }

    const char* path_env = getenv("PATH");
    std::istringstream dirs(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / command;
        if (is_executable_file(candidate)) {
            return candidate.string();
        }
    }
    return {};
}

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw UpdchkException(get_string("error.empty_command"));
    }

    const std::string executable = find_executable(argv[0]);
    if (executable.empty()) {
        throw ToolUnavailableError(string_format("error.tool_not_found", argv[0]));
    }

    FdGuard out_read, out_write, err_read, err_write, exec_read, exec_write;
    make_pipe(out_read, out_write);
    make_pipe(err_read, err_write);
    // Closed by a successful exec; carries errno when exec fails
    make_pipe(exec_read, exec_write);

    std::vector<char*> c_args;
    for (const auto& arg : argv) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        throw ToolUnavailableError(string_format("error.spawn_failed", argv[0], std::string(strerror(errno))));
    }
    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_write.get(), STDOUT_FILENO);
        dup2(err_write.get(), STDERR_FILENO);
        execv(executable.c_str(), c_args.data());
        int exec_errno = errno;
        ssize_t ignored = write(exec_write.get(), &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    out_write.reset();
    err_write.reset();
    exec_write.reset();

    int exec_errno = 0;
    ssize_t exec_bytes;
    do {
        exec_bytes = read(exec_read.get(), &exec_errno, sizeof(exec_errno));
    } while (exec_bytes < 0 && errno == EINTR);
    if (exec_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
        }
        throw ToolUnavailableError(string_format("error.spawn_failed", argv[0], std::string(strerror(exec_errno))));
    }

    ProcessResult result;
    std::array<char, 4096> buffer;
    std::array<pollfd, 2> fds = {{{out_read.get(), POLLIN, 0}, {err_read.get(), POLLIN, 0}}};
    std::array<std::string*, 2> sinks = {&result.stdout_text, &result.stderr_text};
    int open_streams = 2;

    while (open_streams > 0) {
        if (poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw UpdchkException(string_format("error.wait_failed", argv[0], std::string(strerror(errno))));
        }
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}
