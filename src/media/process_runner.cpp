#include "media/process_runner.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace prerender::media {

namespace {

void appendBounded(std::string& out, const char* data, std::size_t len, std::size_t maxBytes) {
    out.append(data, len);
    if (out.size() > maxBytes) {
        out.erase(0, out.size() - maxBytes);
    }
}

}  // namespace

PosixProcessRunner::PosixProcessRunner(std::size_t maxCapturedBytes)
    : maxCapturedBytes_(maxCapturedBytes) {}

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& args) {
    ProcessResult result;
    if (args.empty()) {
        result.spawnErrno = EINVAL;
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int outPipe[2];
    int errPipe[2];
    if (pipe2(outPipe, O_CLOEXEC) != 0) {
        result.spawnErrno = errno;
        LOG_ERROR("Cannot create pipe for {}: {}", describeCommand(args), std::strerror(errno));
        return result;
    }
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        result.spawnErrno = errno;
        close(outPipe[0]);
        close(outPipe[1]);
        LOG_ERROR("Cannot create pipe for {}: {}", describeCommand(args),
                  std::strerror(result.spawnErrno));
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addclose(&actions, outPipe[0]);
    posix_spawn_file_actions_addclose(&actions, errPipe[0]);
    posix_spawn_file_actions_adddup2(&actions, outPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errPipe[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, outPipe[1]);
    posix_spawn_file_actions_addclose(&actions, errPipe[1]);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, args[0].c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(outPipe[1]);
    close(errPipe[1]);

    if (rc != 0) {
        close(outPipe[0]);
        close(errPipe[0]);
        result.spawnErrno = rc;
        LOG_ERROR("Failed to spawn {}: {} ({})", describeCommand(args), rc, std::strerror(rc));
        return result;
    }
    result.spawned = true;

    // Both pipes are drained together so a chatty stderr cannot stall stdout.
    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    int openPipes = 2;
    char buffer[4096];
    while (openPipes > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("poll on {} output failed: {}", args[0], std::strerror(errno));
            break;
        }
        for (auto& pfd : fds) {
            if (pfd.fd < 0 || pfd.revents == 0) {
                continue;
            }
            ssize_t n = read(pfd.fd, buffer, sizeof(buffer));
            if (n > 0) {
                auto len = static_cast<std::size_t>(n);
                appendBounded(result.output, buffer, len, maxCapturedBytes_);
                if (&pfd == &fds[0]) {
                    appendBounded(result.standardOutput, buffer, len, maxCapturedBytes_);
                }
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            close(pfd.fd);
            pfd.fd = -1;
            --openPipes;
        }
    }
    for (const auto& pfd : fds) {
        if (pfd.fd >= 0) {
            close(pfd.fd);
        }
    }

    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (waited == pid && WIFSIGNALED(status)) {
        LOG_WARN("{} terminated by signal {}", args[0], WTERMSIG(status));
    }
    return result;
}

std::string describeCommand(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        bool quote = arg.empty() || arg.find_first_of(" \t'\"|;[]") != std::string::npos;
        if (quote) {
            out.push_back('\'');
            out += arg;
            out.push_back('\'');
        } else {
            out += arg;
        }
    }
    return out;
}

}  // namespace prerender::media
