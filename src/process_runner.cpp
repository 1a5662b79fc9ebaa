#include "process_runner.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

ProcessResult runCommand(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    ProcessResult result;
    if (argv.empty()) {
        result.err = "empty command";
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.err = std::format("pipe failed: {}", std::strerror(errno));
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    std::vector<char*> args;
    for (const auto& s : argv) {
        args.push_back(const_cast<char*>(s.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.err = std::format("fork failed: {}", std::strerror(errno));
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }
    if (pid == 0) {
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        const char* message = "exec failed\n";
        [[maybe_unused]] auto written = ::write(STDERR_FILENO, message, std::strlen(message));
        ::_exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buf{};
    int fds[2] = {outPipe[0], errPipe[0]};
    std::string* sinks[2] = {&result.out, &result.err};

    while (fds[0] >= 0 || fds[1] >= 0) {
        int waitMs = 1000;
        if (timeout.count() > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                result.timedOut = true;
                ::kill(pid, SIGKILL);
                break;
            }
            waitMs = static_cast<int>(std::min<long long>(left.count(), 1000));
        }

        pollfd pfds[2];
        nfds_t count = 0;
        int index[2] = {-1, -1};
        for (int i = 0; i < 2; ++i) {
            if (fds[i] >= 0) {
                pfds[count] = pollfd{fds[i], POLLIN, 0};
                index[count] = i;
                ++count;
            }
        }
        int ready = ::poll(pfds, count, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.err += std::format("poll failed: {}", std::strerror(errno));
            ::kill(pid, SIGKILL);
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (pfds[i].revents == 0) {
                continue;
            }
            int slot = index[i];
            ssize_t n = ::read(fds[slot], buf.data(), buf.size());
            if (n > 0) {
                sinks[slot]->append(buf.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                closeFd(fds[slot]);
            }
        }
    }
    closeFd(fds[0]);
    closeFd(fds[1]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.err += std::format("waitpid failed: {}", std::strerror(errno));
            return result;
        }
    }
    if (!result.timedOut && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}
