#include "infrastructure/ProcessRunner.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace streamscribe::infrastructure {

namespace {

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<char*> MakeArgv(const std::vector<std::string>& args) {
    std::vector<char*> out;
    out.reserve(args.size() + 1);
    for (const auto& arg : args) {
        out.push_back(const_cast<char*>(arg.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

void RedirectOrDiscard(posix_spawn_file_actions_t& actions, int fd, int target) {
    if (fd >= 0) {
        posix_spawn_file_actions_adddup2(&actions, fd, target);
    } else {
        posix_spawn_file_actions_addopen(&actions, target, "/dev/null", O_WRONLY, 0);
    }
}

} // namespace

bool ProcessRunner::Spawn(const std::vector<std::string>& argv, int stdoutFd, int stderrFd,
                          pid_t& pid, std::string& error) {
    if (argv.empty() || argv[0].empty()) {
        error = "empty command";
        return false;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    RedirectOrDiscard(actions, stdoutFd, STDOUT_FILENO);
    RedirectOrDiscard(actions, stderrFd, STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);

    // Own process group: a terminal Ctrl+C reaches only the orchestrator.
    posix_spawnattr_setpgroup(&attr, 0);

    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGTERM);
    sigaddset(&defaults, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaults);

    sigset_t mask;
    sigemptyset(&mask);
    posix_spawnattr_setsigmask(&attr, &mask);

    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

    std::vector<char*> args = MakeArgv(argv);
    const int rc = ::posix_spawnp(&pid, args[0], &actions, &attr, args.data(), environ);

    posix_spawnattr_destroy(&attr);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        error = argv[0] + ": " + std::strerror(rc);
        pid = -1;
        return false;
    }
    return true;
}

int ProcessRunner::DecodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

int ProcessRunner::WaitForExit(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return DecodeStatus(status);
}

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    ProcessResult result;

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        CloseFd(outPipe[0]);
        CloseFd(outPipe[1]);
        return result;
    }

    pid_t pid = -1;
    std::string spawnError;
    const bool spawned = Spawn(argv, outPipe[1], errPipe[1], pid, spawnError);
    CloseFd(outPipe[1]);
    CloseFd(errPipe[1]);

    if (!spawned) {
        CloseFd(outPipe[0]);
        CloseFd(errPipe[0]);
        result.error = spawnError;
        return result;
    }
    result.launched = true;

    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    // Drain both channels together so a chatty stderr cannot stall stdout.
    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.primaryOutput, &result.diagnosticOutput};
    int openChannels = 2;
    char buffer[4096];
    bool killChild = false;

    while (openChannels > 0) {
        int waitMs = -1;
        if (bounded) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                result.timedOut = true;
                killChild = true;
                break;
            }
            waitMs = static_cast<int>(std::min<long long>(remaining, INT_MAX));
        }

        const int ready = ::poll(fds, 2, waitMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = std::string("poll: ") + std::strerror(errno);
            killChild = true;
            break;
        }
        if (ready == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --openChannels;
            }
        }
    }

    if (killChild) {
        ::kill(-pid, SIGKILL);
    }
    for (auto& fd : fds) {
        CloseFd(fd.fd);
    }

    result.exitCode = WaitForExit(pid);
    return result;
}

} // namespace streamscribe::infrastructure
