#include <nixup/process.hpp>
#include <nixup/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace nixup {

namespace {

struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() { close_both(); }

    int& read_end() { return fds[0]; }
    int& write_end() { return fds[1]; }

    void close_end(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
    void close_both() {
        close_end(fds[0]);
        close_end(fds[1]);
    }
};

NixupError sys_error(const char* what) {
    return NixupError{NixupError::IO,
        std::string(what) + " failed: " + std::strerror(errno)};
}

// Read whatever is available; closes the fd on EOF
void drain(int& fd, std::string& out) {
    char buf[4096];
    while (fd >= 0) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            ::close(fd);
            fd = -1;
        } else {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                ::close(fd);
                fd = -1;
            }
            return;
        }
    }
}

} // anonymous namespace

std::string command_line(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ' ';
        if (args[i].find_first_of(" \t\"'") != std::string::npos) {
            out += '\'' + args[i] + '\'';
        } else {
            out += args[i];
        }
    }
    return out;
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return NixupError{NixupError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    Pipe out_pipe, err_pipe;
    if (pipe(out_pipe.fds) != 0 || pipe(err_pipe.fds) != 0) {
        return sys_error("pipe()");
    }

    log::trace("exec: %s", command_line(args).c_str());

    pid_t pid = fork();
    if (pid < 0) {
        return sys_error("fork()");
    }

    if (pid == 0) {
        dup2(out_pipe.write_end(), STDOUT_FILENO);
        dup2(err_pipe.write_end(), STDERR_FILENO);
        ::close(out_pipe.read_end());
        ::close(err_pipe.read_end());
        ::close(out_pipe.write_end());
        ::close(err_pipe.write_end());

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    out_pipe.close_end(out_pipe.write_end());
    err_pipe.close_end(err_pipe.write_end());
    fcntl(out_pipe.read_end(), F_SETFL, O_NONBLOCK);
    fcntl(err_pipe.read_end(), F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto deadline = std::chrono::steady_clock::now()
                    + std::chrono::seconds(timeout_seconds);

    // Read until both pipes hit EOF, then reap the child
    while (out_pipe.read_end() >= 0 || err_pipe.read_end() >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return NixupError{NixupError::IO,
                "command timed out after " + std::to_string(timeout_seconds) + "s",
                "", command_line(args)};
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_pipe.read_end() >= 0) fds[nfds++] = {out_pipe.read_end(), POLLIN, 0};
        if (err_pipe.read_end() >= 0) fds[nfds++] = {err_pipe.read_end(), POLLIN, 0};

        int rc = poll(fds, nfds, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return sys_error("poll()");
        }

        drain(out_pipe.read_end(), out_buf);
        drain(err_pipe.read_end(), err_buf);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return sys_error("waitpid()");
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return Result<CommandResult>::ok(
        CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
}

} // namespace nixup
