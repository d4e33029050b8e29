#include "process_runner.hpp"
#include "error.hpp"
#include "logging/logging.hpp"
#include "pipe.hpp"

#include <algorithm>
#include <array>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
}

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("nmbackport.ipc.ProcessRunner");

namespace ipc {

    namespace {
        namespace cr = std::chrono;

        // async-signal-safe error report from the child
        [[noreturn]] void childFail(const char *what, int exitCode) noexcept {
            const char *reason = strerror(errno);
            std::ignore = ::write(STDERR_FILENO, what, strlen(what));
            std::ignore = ::write(STDERR_FILENO, ": ", 2);
            std::ignore = ::write(STDERR_FILENO, reason, strlen(reason));
            std::ignore = ::write(STDERR_FILENO, "\n", 1);
            _exit(exitCode);
        }
    } // namespace

    pid_t LinuxProcessRunner::spawn(const Startable &startable, int outFd, int errFd) {
        // Note: all memory allocation for the child process must be performed before forking
        std::vector<std::string> args;
        args.reserve(startable.getArguments().size() + 1);
        args.push_back(startable.getCommand());
        args.insert(args.end(), startable.getArguments().begin(), startable.getArguments().end());

        // null terminated as of C++11
        std::vector<char *> argv(args.size() + 1, nullptr);
        std::transform(
            args.begin(), args.end(), argv.begin(), [](std::string &s) { return s.data(); });

        std::string workingDir;
        if(startable.getWorkingDirectory().has_value()) {
            workingDir = startable.getWorkingDirectory()->string();
        }

        pid_t pid = fork();
        switch(pid) {
            // parent, on error
            case -1:
                throw std::system_error(errno, std::generic_category(), "fork");

            // child, runs process
            case 0: {
                // At this point, child should be extremely careful which APIs they call;
                // async-signal-safe to be safest

                // set pgid to current child pid so all decendants are reaped when
                // SIGKILL/SIGTERM is received
                std::ignore = setpgid(0, 0);

                // the blocked mask of the parent survives exec
                sigset_t none;
                sigemptyset(&none);
                std::ignore = sigprocmask(SIG_SETMASK, &none, nullptr);

                if(::dup2(outFd, STDOUT_FILENO) == -1 || ::dup2(errFd, STDERR_FILENO) == -1) {
                    _exit(CommandResult::CANNOT_START);
                }

                // stdin reads as empty
                int nullFd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
                if(nullFd == -1 || ::dup2(nullFd, STDIN_FILENO) == -1) {
                    childFail("/dev/null", CommandResult::CANNOT_START);
                }

                if(!workingDir.empty() && chdir(workingDir.c_str()) == -1) {
                    childFail("chdir", CommandResult::CANNOT_START);
                }

                std::ignore = execvp(argv[0], argv.data());
                // only reachable if exec fails
                childFail(argv[0], CommandResult::NOT_EXECUTABLE);
            }

            // parent process, PID is child process
            default:
                // also set from parent to close the race with a fast timeout
                std::ignore = setpgid(pid, pid);
                return pid;
        }
    }

    int LinuxProcessRunner::waitForExit(pid_t pid) {
        while(true) {
            int stat{0};
            pid_t ret = waitpid(pid, &stat, 0);
            if(ret == -1) {
                if(errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "waitpid");
            }
            if(WIFEXITED(stat)) {
                return WEXITSTATUS(stat);
            }
            if(WIFSIGNALED(stat)) {
                return 128 + WTERMSIG(stat);
            }
        }
    }

    CommandResult LinuxProcessRunner::run(const Startable &startable) {
        if(startable.getCommand().empty()) {
            throw std::invalid_argument("No command provided");
        }
        LOG.atDebug("process-start")
            .kv("command", startable.toString())
            .kv("cwd",
                startable.getWorkingDirectory().has_value()
                    ? startable.getWorkingDirectory()->string()
                    : std::string{})
            .log();

        Pipe outPipe{};
        Pipe errPipe{};
        pid_t pid = spawn(startable, outPipe.input().get(), errPipe.input().get());
        outPipe.input().close();
        errPipe.input().close();

        CommandResult result;
        std::optional<cr::steady_clock::time_point> deadline;
        if(startable.getTimeout().has_value()) {
            deadline = cr::steady_clock::now() + startable.getTimeout().value();
        }
        bool terminated = false;
        std::optional<cr::steady_clock::time_point> killAt;

        std::array<pollfd, 2> fds{};
        fds[0].fd = outPipe.output().get();
        fds[0].events = POLLIN | POLLPRI;
        fds[1].fd = errPipe.output().get();
        fds[1].events = POLLIN | POLLPRI;

        static constexpr int pollTimeoutMs = 1000;

        while(fds[0].fd >= 0 || fds[1].fd >= 0) {
            int waitMs = pollTimeoutMs;
            auto now = cr::steady_clock::now();
            if(deadline.has_value() && !terminated) {
                if(now >= deadline.value()) {
                    LOG.atWarn("process-timeout")
                        .kv("command", startable.toString())
                        .kv("timeoutMs", startable.getTimeout()->count())
                        .log("Terminating process group");
                    std::ignore = ::kill(-pid, SIGTERM);
                    terminated = true;
                    result.timedOut = true;
                    killAt = now + _killGrace;
                } else {
                    waitMs = std::min<int>(
                        waitMs,
                        static_cast<int>(
                            cr::duration_cast<cr::milliseconds>(deadline.value() - now).count()
                            + 1));
                }
            }
            if(killAt.has_value()) {
                if(now >= killAt.value()) {
                    std::ignore = ::kill(-pid, SIGKILL);
                    killAt.reset();
                    // descendants may still hold the pipes; stop reading
                    break;
                }
                waitMs = std::min<int>(
                    waitMs,
                    static_cast<int>(
                        cr::duration_cast<cr::milliseconds>(killAt.value() - now).count() + 1));
            }

            int rc = poll(fds.data(), fds.size(), waitMs);
            if(rc == -1) {
                if(isRetryableError(errno)) {
                    continue;
                }
                int savedErrno = errno;
                std::ignore = ::kill(-pid, SIGKILL);
                std::ignore = waitForExit(pid);
                throw std::system_error(savedErrno, std::generic_category(), "poll");
            }

            if(fds[0].fd >= 0 && fds[0].revents != 0) {
                if(!outPipe.output().readAvailable(result.out)) {
                    outPipe.output().close();
                    fds[0].fd = -1;
                }
            }
            if(fds[1].fd >= 0 && fds[1].revents != 0) {
                if(!errPipe.output().readAvailable(result.err)) {
                    errPipe.output().close();
                    fds[1].fd = -1;
                }
            }
        }

        result.returnCode = waitForExit(pid);
        if(result.timedOut) {
            result.returnCode = CommandResult::TIMED_OUT;
            if(!result.err.empty() && result.err.back() != '\n') {
                result.err += '\n';
            }
            result.err += "timed out";
        }
        LOG.atDebug("process-exit")
            .kv("command", startable.getCommand())
            .kv("returnCode", result.returnCode)
            .log();
        return result;
    }
} // namespace ipc
