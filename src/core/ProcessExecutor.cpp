#include "ProcessExecutor.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gemini_mcp {

namespace {

// Reported by the child over the close-on-exec status pipe
enum class ChildStage : int {
    OpenStdin = 1,
    ChangeDirectory = 2,
    Exec = 3
};

struct ChildFailure {
    ChildStage stage;
    int error;
};

/**
 * @brief Owns a pipe file descriptor pair
 */
class Pipe {
public:
    explicit Pipe(int flags = O_CLOEXEC) {
        if (pipe2(fds_, flags) != 0) {
            throw SpawnError(std::string("Failed to create pipe: ") + std::strerror(errno));
        }
    }

    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_fd() const { return fds_[0]; }
    int write_fd() const { return fds_[1]; }

    void close_read() { close_fd(fds_[0]); }
    void close_write() { close_fd(fds_[1]); }

private:
    static void close_fd(int& fd) {
        if (fd >= 0) {
            static_cast<void>(::close(fd));
            fd = -1;
        }
    }

    int fds_[2] = {-1, -1};
};

void set_nonblocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Returns false once the write end is closed
bool drain(int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

[[noreturn]] void child_fail(int status_fd, ChildStage stage) {
    ChildFailure failure{stage, errno};
    static_cast<void>(::write(status_fd, &failure, sizeof(failure)));
    _exit(127);
}

std::string describe(const ChildFailure& failure, const CommandVector& command,
                     const std::filesystem::path& cwd) {
    const std::string reason = std::strerror(failure.error);
    switch (failure.stage) {
        case ChildStage::OpenStdin:
            return "Cannot open /dev/null: " + reason;
        case ChildStage::ChangeDirectory:
            return "Cannot change to working directory '" + cwd.string() + "': " + reason;
        case ChildStage::Exec:
            break;
    }
    return "Cannot execute '" + command.front() + "': " + reason;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

ExecutionResult spawn_process(const CommandVector& command,
                              const std::filesystem::path& cwd,
                              std::chrono::seconds timeout) {
    if (command.empty()) {
        throw SpawnError("Empty command");
    }

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    Pipe stdout_pipe;
    Pipe stderr_pipe;
    Pipe status_pipe;

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        throw SpawnError(std::string("Failed to fork process: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Own process group, so a timeout also reaches background grandchildren
        static_cast<void>(setpgid(0, 0));
        // Signal mask and ignored dispositions survive exec; give the program defaults
        sigset_t none;
        sigemptyset(&none);
        static_cast<void>(sigprocmask(SIG_SETMASK, &none, nullptr));
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull < 0) {
            child_fail(status_pipe.write_fd(), ChildStage::OpenStdin);
        }
        static_cast<void>(dup2(devnull, STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe.write_fd(), STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe.write_fd(), STDERR_FILENO));
        static_cast<void>(::close(devnull));
        static_cast<void>(::close(stdout_pipe.read_fd()));
        static_cast<void>(::close(stderr_pipe.read_fd()));
        static_cast<void>(::close(stdout_pipe.write_fd()));
        static_cast<void>(::close(stderr_pipe.write_fd()));

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_fail(status_pipe.write_fd(), ChildStage::ChangeDirectory);
        }
        execvp(argv[0], argv.data());
        child_fail(status_pipe.write_fd(), ChildStage::Exec);
    }

    stdout_pipe.close_write();
    stderr_pipe.close_write();
    status_pipe.close_write();

    // Blocks until exec succeeds (pipe closed by O_CLOEXEC) or the child reports failure
    ChildFailure failure{};
    ssize_t got;
    do {
        got = ::read(status_pipe.read_fd(), &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int ignored = 0;
        static_cast<void>(waitpid(pid, &ignored, 0));
        throw SpawnError(describe(failure, command, cwd));
    }

    set_nonblocking(stdout_pipe.read_fd());
    set_nonblocking(stderr_pipe.read_fd());

    ExecutionResult result;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto elapsed = std::chrono::steady_clock::now() - started;
        // Checked after the child exits too: a grandchild may still hold the pipes
        if (!result.timed_out && timeout.count() > 0 && elapsed > timeout) {
            spdlog::warn("Command '{}' exceeded {}s timeout, killing process group {}",
                         command.front(), timeout.count(), pid);
            result.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
            if (!child_exited) {
                static_cast<void>(kill(pid, SIGKILL));
            }
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe.read_fd();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe.read_fd();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        // With both pipes closed this still sleeps, keeping the timeout check live
        static_cast<void>(poll(nfds > 0 ? fds : nullptr, nfds, 50));

        if (stdout_open) {
            stdout_open = drain(stdout_pipe.read_fd(), result.stdout_text);
        }
        if (stderr_open) {
            stderr_open = drain(stderr_pipe.read_fd(), result.stderr_text);
        }

        if (!child_exited && waitpid(pid, &status, WNOHANG) == pid) {
            child_exited = true;
        }

        // Past the deadline, stop draining once the child is reaped
        if (child_exited && result.timed_out) {
            break;
        }
    }

    result.exit_code = decode_status(status);
    if (result.timed_out) {
        result.exit_code = ProcessExecutor::kTimeoutExitCode;
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
            result.stderr_text += '\n';
        }
        result.stderr_text += "Command timed out after " + std::to_string(timeout.count()) + " seconds";
    }

    spdlog::debug("Command '{}' finished with exit code {} ({} bytes stdout, {} bytes stderr)",
                  command.front(), result.exit_code,
                  result.stdout_text.size(), result.stderr_text.size());
    return result;
}

ProcessExecutor::ProcessExecutor(ExecutorOptions options, SpawnFunction spawn)
    : options_(std::move(options)), spawn_(std::move(spawn)) {
    if (options_.program.empty()) {
        throw std::invalid_argument("Program name cannot be empty");
    }
    if (!spawn_) {
        throw std::invalid_argument("Spawn function cannot be null");
    }
}

bool ProcessExecutor::probe_available() {
    ExecutionResult probe = spawn_({"which", options_.program}, {}, options_.timeout);
    if (!probe.success()) {
        spdlog::warn("Program '{}' not found on PATH (which exited {})",
                     options_.program, probe.exit_code);
        return false;
    }
    return true;
}

ExecutionResult ProcessExecutor::run(const CommandVector& command,
                                     const std::optional<std::string>& cwd) {
    try {
        if (!probe_available()) {
            return {"", kNotFoundMessage, 1, false};
        }

        std::filesystem::path workdir = cwd && !cwd->empty()
            ? std::filesystem::path(*cwd)
            : std::filesystem::current_path();

        spdlog::info("Running {} in {}", command.empty() ? "<empty>" : command.front(),
                     workdir.string());
        return spawn_(command, workdir, options_.timeout);

    } catch (const std::exception& e) {
        spdlog::error("Failed to run command: {}", e.what());
        return {"", std::string("Error running gemini command: ") + e.what(), 1, false};
    }
}

} // namespace gemini_mcp
