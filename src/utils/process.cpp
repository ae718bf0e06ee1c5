#include "../include/utils/process.hpp"
#include "../include/utils/logger.hpp"

#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <poll.h>

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace nudger {

namespace {

std::vector<char*> toArgv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        out.push_back(const_cast<char*>(arg.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

std::string readWithTimeout(int fd, int timeout_ms) {
    std::string out;
    char buf[4096];
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    int remaining = timeout_ms;
    const int step = 50;

    while (remaining > 0) {
        int r = ::poll(&pfd, 1, step);
        if (r > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                out.append(buf, buf + n);
                if (out.size() > 64 * 1024) break;
                continue;
            }
            break; // EOF or read error
        }
        if (r < 0 && errno != EINTR) {
            break;
        }
        remaining -= step;
    }
    return out;
}

} // namespace

pid_t Process::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) return -1;
    std::vector<char*> args = toArgv(argv);

    pid_t pid = ::fork();
    if (pid == 0) {
        ::setpgid(0, 0);
        ::execvp(args[0], args.data());
        _exit(127);
    }
    if (pid < 0) {
        Logger::getInstance().error("Process: fork failed for " + argv[0]);
        return -1;
    }
    Logger::getInstance().debug("Process: spawned " + argv[0] + " as pid " + std::to_string(pid));
    return pid;
}

Process::Result Process::run(const std::vector<std::string>& argv, int timeout_ms) {
    Result result;
    if (argv.empty()) return result;

    int out_pipe[2];
    if (::pipe(out_pipe) != 0) return result;

    std::vector<char*> args = toArgv(argv);
    pid_t pid = ::fork();
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::execvp(args[0], args.data());
        _exit(127);
    }
    ::close(out_pipe[1]);
    if (pid < 0) {
        ::close(out_pipe[0]);
        return result;
    }
    result.started = true;
    result.out = readWithTimeout(out_pipe[0], timeout_ms);
    ::close(out_pipe[0]);

    int status = 0;
    int waited = 0;
    while (waited < timeout_ms) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            }
            return result;
        }
        if (w < 0) {
            return result;
        }
        ::usleep(10 * 1000);
        waited += 10;
    }
    ::kill(pid, SIGKILL);
    ::waitpid(pid, &status, 0);
    result.timed_out = true;
    Logger::getInstance().warning("Process: " + argv[0] + " timed out after " +
                                  std::to_string(timeout_ms) + "ms");
    return result;
}

bool Process::hasExited(pid_t pid, int* exit_code) {
    if (pid <= 0) return true;
    int status = 0;
    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == 0) return false;
    if (w == pid && exit_code && WIFEXITED(status)) {
        *exit_code = WEXITSTATUS(status);
    }
    // w < 0: not our child or already reaped
    return true;
}

void Process::terminate(pid_t pid, int grace_ms) {
    if (hasExited(pid)) return;

    // spawn() moves the child into its own group; it may not have got there yet.
    if (::kill(-pid, SIGTERM) != 0) {
        ::kill(pid, SIGTERM);
    }
    int waited = 0;
    while (waited < grace_ms) {
        if (hasExited(pid)) {
            Logger::getInstance().debug("Process: terminated pid " + std::to_string(pid));
            return;
        }
        ::usleep(10 * 1000);
        waited += 10;
    }
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int status = 0;
    ::waitpid(pid, &status, 0);
    Logger::getInstance().warning("Process: pid " + std::to_string(pid) + " killed after " +
                                  std::to_string(grace_ms) + "ms");
}

bool Process::isExecutable(const std::string& program) {
    if (program.empty()) return false;
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0;
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;
    std::istringstream iss(path_env);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) continue;
        const std::string candidate = dir + "/" + program;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace nudger
