#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <poll.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Drain both pipes until EOF on each. Reading them together keeps a chatty
// child from blocking on a full stderr pipe while we wait on stdout.
static void drain_pipes(int& out_fd, int& err_fd, ProcessResult& result) {
    char buf[4096];

    while (out_fd >= 0 || err_fd >= 0) {
        pollfd fds[2];
        int count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};

        int ready = poll(fds, count, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (int i = 0; i < count; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;

            bool is_out = fds[i].fd == out_fd;
            if (n <= 0) {
                close_fd(is_out ? out_fd : err_fd);
            } else if (is_out) {
                result.stdout_data.append(buf, static_cast<size_t>(n));
            } else {
                result.stderr_data.append(buf, static_cast<size_t>(n));
            }
        }
    }

    close_fd(out_fd);
    close_fd(err_fd);
}

ProcessResult run_process(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::filesystem::path& working_dir) {
    ProcessResult result;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (pipe(err_pipe) != 0) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    // Build argv before forking; the child must not allocate
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    std::string cwd = working_dir.string();

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_data = std::string("fork failed: ") + std::strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const char* msg = "cannot change to working directory\n";
            ssize_t ignored = write(STDERR_FILENO, msg, std::strlen(msg));
            (void)ignored;
            _exit(127);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    drain_pipes(out_fd, err_fd, result);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }

    if (result.exit_code == 127 && result.stderr_data.empty()) {
        result.stderr_data = program + ": command not found";
    }
    return result;
}

} // namespace platform
