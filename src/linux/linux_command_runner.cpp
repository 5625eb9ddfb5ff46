#include "linux_command_runner.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace quay {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void write_errno_and_exit(int fd, int err) {
    ssize_t written = write(fd, &err, sizeof(err));
    (void)written;
    _exit(127);
}

} // namespace

std::vector<char*> LinuxCommandRunner::make_exec_args(const std::vector<std::string>& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    return args;
}

void LinuxCommandRunner::redirect_to_dev_null(int fd, int flags) {
    int null_fd = open("/dev/null", flags);
    if (null_fd >= 0) {
        dup2(null_fd, fd);
        close(null_fd);
    }
}

bool LinuxCommandRunner::read_available(int fd, std::string& buffer) {
    char chunk[4096];
    ssize_t n = read(fd, chunk, sizeof(chunk));
    if (n > 0) {
        buffer.append(chunk, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;  // EOF or hard error
}

// The exec-status pipe is close-on-exec: EOF means execvp succeeded,
// an int payload is the errno of the failed exec.
int LinuxCommandRunner::read_exec_errno(int fd) {
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

CommandResult LinuxCommandRunner::run(const std::vector<std::string>& argv,
                                      std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty()) {
        result.error_message = "Empty command";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(out_pipe) == -1 || pipe(err_pipe) == -1 || pipe2(exec_pipe, O_CLOEXEC) == -1) {
        result.error_message = fmt::format("pipe failed: {}", strerror(errno));
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        return result;
    }

    auto args = make_exec_args(argv);
    pid_t pid = fork();
    if (pid == -1) {
        result.error_message = fmt::format("fork failed: {}", strerror(errno));
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // child
        redirect_to_dev_null(STDIN_FILENO, O_RDONLY);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        close(exec_pipe[0]);
        execvp(args[0], args.data());
        write_errno_and_exit(exec_pipe[1], errno);
    }

    // parent
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    if (int child_errno = read_exec_errno(exec_pipe[0]); child_errno != 0) {
        close_fd(exec_pipe[0]);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        result.error_message = fmt::format("failed to run {}: {}", argv[0], strerror(child_errno));
        spdlog::debug("{}", result.error_message);
        return result;
    }
    close_fd(exec_pipe[0]);
    result.launched = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            kill(pid, SIGKILL);
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        int out_index = -1;
        int err_index = -1;
        if (out_open) {
            out_index = static_cast<int>(count);
            fds[count++] = {out_pipe[0], POLLIN, 0};
        }
        if (err_open) {
            err_index = static_cast<int>(count);
            fds[count++] = {err_pipe[0], POLLIN, 0};
        }

        int ready = poll(fds, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error_message = fmt::format("poll failed: {}", strerror(errno));
            kill(pid, SIGKILL);
            break;
        }
        if (ready == 0) continue;

        if (out_index >= 0 && fds[out_index].revents != 0) {
            out_open = read_available(out_pipe[0], result.out);
        }
        if (err_index >= 0 && fds[err_index].revents != 0) {
            err_open = read_available(err_pipe[0], result.err);
        }
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            status = -1;
            break;
        }
    }

    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (status != -1 && WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    spdlog::debug("ran '{}' exit={} timed_out={}", argv[0], result.exit_code, result.timed_out);
    return result;
}

SpawnResult LinuxCommandRunner::spawn_detached(const std::vector<std::string>& argv) {
    SpawnResult result;
    if (argv.empty()) {
        result.error_message = "Empty command";
        return result;
    }

    int pid_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(pid_pipe) == -1 || pipe2(exec_pipe, O_CLOEXEC) == -1) {
        result.error_message = fmt::format("pipe failed: {}", strerror(errno));
        close_fd(pid_pipe[0]); close_fd(pid_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        return result;
    }

    auto args = make_exec_args(argv);

    // Double fork: the intermediate child exits at once so the grandchild is
    // reparented to init and never becomes our zombie.
    pid_t intermediate = fork();
    if (intermediate == -1) {
        result.error_message = fmt::format("fork failed: {}", strerror(errno));
        close_fd(pid_pipe[0]); close_fd(pid_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        return result;
    }

    if (intermediate == 0) {
        close(pid_pipe[0]);
        close(exec_pipe[0]);
        setsid();
        pid_t grandchild = fork();
        if (grandchild == 0) {
            close(pid_pipe[1]);
            redirect_to_dev_null(STDIN_FILENO, O_RDONLY);
            redirect_to_dev_null(STDOUT_FILENO, O_WRONLY);
            redirect_to_dev_null(STDERR_FILENO, O_WRONLY);
            execvp(args[0], args.data());
            write_errno_and_exit(exec_pipe[1], errno);
        }
        ssize_t written = write(pid_pipe[1], &grandchild, sizeof(grandchild));
        (void)written;
        _exit(grandchild > 0 ? 0 : 1);
    }

    close_fd(pid_pipe[1]);
    close_fd(exec_pipe[1]);

    pid_t grandchild = -1;
    ssize_t n;
    do {
        n = read(pid_pipe[0], &grandchild, sizeof(grandchild));
    } while (n < 0 && errno == EINTR);
    close_fd(pid_pipe[0]);

    int status = 0;
    while (waitpid(intermediate, &status, 0) == -1 && errno == EINTR) {
    }

    if (n != static_cast<ssize_t>(sizeof(grandchild)) || grandchild <= 0) {
        close_fd(exec_pipe[0]);
        result.error_message = "fork failed in background launcher";
        return result;
    }

    if (int child_errno = read_exec_errno(exec_pipe[0]); child_errno != 0) {
        close_fd(exec_pipe[0]);
        result.error_message = fmt::format("failed to run {}: {}", argv[0], strerror(child_errno));
        return result;
    }
    close_fd(exec_pipe[0]);

    result.success = true;
    result.pid = grandchild;
    spdlog::info("spawned '{}' in background, pid {}", argv[0], grandchild);
    return result;
}

} // namespace quay
