#include "exec/ActionExecutor.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace whichkey::exec {

namespace {

// Reported through the status pipe by the child
struct ChildFailure {
    int step;  // index into STEP_NAMES
    int err;
};

constexpr const char* STEP_NAMES[] = {"setsid", "fork", "open /dev/null", "dup2", "exec"};

std::vector<std::string> merged_environment(const Environment& extra) {
    std::vector<std::string> env;
    for (char** it = environ; it && *it; ++it) {
        std::string entry(*it);
        auto eq = entry.find('=');
        std::string name = entry.substr(0, eq);
        bool overridden = false;
        for (const auto& [key, value] : extra) {
            if (key == name) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : extra) {
        env.push_back(key + "=" + value);
    }
    return env;
}

// Descriptors above stderr (the log file, the compositor socket, timerfds)
// must not leak into the command
void mark_inherited_cloexec() {
    if (close_range(STDERR_FILENO + 1, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return;
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0) max_fd = 1024;
    for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
        int flags = fcntl(fd, F_GETFD);
        if (flags >= 0) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

[[noreturn]] void fail(int fd, int step) {
    ChildFailure failure{step, errno};
    ssize_t ignored = write(fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

}  // namespace

ShellExecutor::ShellExecutor(std::string shell)
    : shell_(std::move(shell)) {}

std::optional<SpawnError> ShellExecutor::run(const std::string& command, const Environment& extra) {
    // Everything the child touches is prepared before fork
    auto env_strings = merged_environment(extra);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::string shell = shell_;
    std::string flag = "-c";
    std::string cmd = command;
    char* argv[] = {shell.data(), flag.data(), cmd.data(), nullptr};

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        return SpawnError{errno, std::format("pipe: {}", std::strerror(errno))};
    }

    pid_t child = fork();
    if (child < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        return SpawnError{err, std::format("fork: {}", std::strerror(err))};
    }

    if (child == 0) {
        // Intermediate child: detach, then fork the real command and exit so
        // the grandchild is adopted by init
        close(status_pipe[0]);
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        if (setsid() < 0) fail(status_pipe[1], 0);

        pid_t grandchild = fork();
        if (grandchild < 0) fail(status_pipe[1], 1);
        if (grandchild > 0) _exit(0);

        int devnull = open("/dev/null", O_RDWR);
        if (devnull < 0) fail(status_pipe[1], 2);
        if (dup2(devnull, STDIN_FILENO) < 0 || dup2(devnull, STDOUT_FILENO) < 0 ||
            dup2(devnull, STDERR_FILENO) < 0) {
            fail(status_pipe[1], 3);
        }
        if (devnull > STDERR_FILENO) close(devnull);
        mark_inherited_cloexec();

        execve(argv[0], argv, envp.data());
        fail(status_pipe[1], 4);
    }

    close(status_pipe[1]);

    int wstatus = 0;
    while (waitpid(child, &wstatus, 0) < 0) {
        if (errno != EINTR) {
            util::Logger::warn(std::format("ShellExecutor: waitpid failed: {}", std::strerror(errno)));
            break;
        }
    }

    // EOF without data means exec succeeded and closed the pipe
    ChildFailure failure{};
    ssize_t n;
    do {
        n = read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        return SpawnError{failure.err, std::format("{}: {}", STEP_NAMES[failure.step], std::strerror(failure.err))};
    }

    util::Logger::info(std::format("ShellExecutor: Launched '{}'", command));
    return std::nullopt;
}

}  // namespace whichkey::exec
