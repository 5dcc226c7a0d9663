#include <fastinstall/process.hpp>
#include <fastinstall/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fastinstall {

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

// Append whatever is readable; returns false once the pipe hit EOF
static bool drain(int fd, std::string& out) {
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return FastInstallError{FastInstallError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // Close-on-exec so children forked by other threads never inherit our
    // write ends; dup2 clears the flag on the child's fds 1 and 2
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        return FastInstallError{FastInstallError::IO,
            std::string("pipe2() failed: ") + std::strerror(saved)};
    }

    log::trace("exec: %s%s%s", args[0].c_str(),
               working_dir.empty() ? "" : " in ", working_dir.c_str());

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        return FastInstallError{FastInstallError::IO,
            std::string("fork() failed: ") + std::strerror(saved)};
    }

    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close_pair(out_pipe);
        close_pair(err_pipe);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    CommandResult result;
    bool out_open = true;
    bool err_open = true;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(timeout_seconds);

    while (out_open || err_open) {
        int wait_ms = 100;
        if (timeout_seconds > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close(out_pipe[0]);
                close(err_pipe[0]);
                return FastInstallError{FastInstallError::Timeout,
                    "'" + args[0] + "' timed out after " +
                    std::to_string(timeout_seconds) + "s"};
            }
            if (left < wait_ms) wait_ms = static_cast<int>(left);
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
        if (err_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};

        int rc = poll(fds, nfds, wait_ms);
        if (rc < 0 && errno != EINTR) {
            int saved = errno;
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(out_pipe[0]);
            close(err_pipe[0]);
            return FastInstallError{FastInstallError::IO,
                std::string("poll() failed: ") + std::strerror(saved)};
        }

        if (out_open) out_open = drain(out_pipe[0], result.stdout_str);
        if (err_open) err_open = drain(err_pipe[0], result.stderr_str);
    }

    close(out_pipe[0]);
    close(err_pipe[0]);

    int status = 0;
    pid_t w;
    do {
        w = waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0) {
        return FastInstallError{FastInstallError::IO,
            std::string("waitpid failed: ") + std::strerror(errno)};
    }

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return Result<CommandResult>::ok(std::move(result));
}

std::string last_line(const std::string& output) {
    auto end = output.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return "";
    auto start = output.find_last_of('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return output.substr(start, end - start + 1);
}

} // namespace fastinstall
