#include "platform/Subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "platform/Log.hpp"

namespace roiwatch {

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{5};

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Returns false once the pipe reached EOF.
bool drain(int fd, std::string& sink) {
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, static_cast<size_t>(n));
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

}  // namespace

bool runProcess(const std::vector<std::string>& argv,
                std::chrono::milliseconds timeout, ProcessOutput& result,
                std::string* err) {
    if (argv.empty()) {
        if (err) {
            *err = "empty command line";
        }
        return false;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe(outPipe) != 0 || pipe(errPipe) != 0) {
        if (err) {
            *err = std::string("pipe failed: ") + std::strerror(errno);
        }
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return false;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        if (err) {
            *err = std::string("fork failed: ") + std::strerror(errno);
        }
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return false;
    }
    if (pid == 0) {
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    fcntl(outPipe[0], F_SETFL, O_NONBLOCK);
    fcntl(errPipe[0], F_SETFL, O_NONBLOCK);

    result = ProcessOutput{};
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timedOut = false;
    bool pollFailed = false;
    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }
        pollfd fds[2];
        nfds_t count = 0;
        if (outPipe[0] >= 0) {
            fds[count++] = {outPipe[0], POLLIN, 0};
        }
        if (errPipe[0] >= 0) {
            fds[count++] = {errPipe[0], POLLIN, 0};
        }
        int rc = poll(fds, count, static_cast<int>(remaining.count()));
        if (rc < 0 && errno != EINTR) {
            LOG_WARN("process: poll failed: %s", std::strerror(errno));
            pollFailed = true;
            break;
        }
        if (outPipe[0] >= 0 && !drain(outPipe[0], result.out)) {
            closeFd(outPipe[0]);
        }
        if (errPipe[0] >= 0 && !drain(errPipe[0], result.err)) {
            closeFd(errPipe[0]);
        }
    }
    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    // The child may close its pipes and keep running; the deadline still
    // applies to its exit.
    int status = 0;
    bool reaped = false;
    while (!timedOut && !pollFailed) {
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            reaped = true;
            break;
        }
        if (rc < 0 && errno != EINTR) {
            LOG_WARN("process: waitpid failed: %s", std::strerror(errno));
            pollFailed = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timedOut = true;
            break;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
    if (!reaped) {
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    if (timedOut) {
        if (err) {
            *err = argv[0] + " timed out after " +
                   std::to_string(timeout.count()) + " ms";
        }
        return false;
    }
    if (pollFailed) {
        if (err) {
            *err = "lost track of " + argv[0] + ", child killed";
        }
        return false;
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    if (result.exitCode == 127) {
        if (err) {
            *err = "failed to execute " + argv[0];
        }
        return false;
    }
    return true;
}

}  // namespace roiwatch
