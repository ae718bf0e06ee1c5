#ifndef NUDGER_PROCESS_HPP
#define NUDGER_PROCESS_HPP

#include <sys/types.h>
#include <string>
#include <vector>

namespace nudger {

// Child processes spawned for excursions and idle probe commands.
class Process {
public:
    struct Result {
        bool started = false;
        bool timed_out = false;
        int exit_code = -1;
        std::string out;
    };

    // fork + execvp with stdin/stdout/stderr inherited. Returns -1 on failure.
    static pid_t spawn(const std::vector<std::string>& argv);

    // Runs argv to completion, capturing stdout. The child is killed after timeout_ms.
    static Result run(const std::vector<std::string>& argv, int timeout_ms);

    // Reaps the child if it exited. True once the child is gone.
    static bool hasExited(pid_t pid, int* exit_code = nullptr);

    // SIGTERM to the child's process group, SIGKILL after grace_ms. Always reaps.
    static void terminate(pid_t pid, int grace_ms);

    // Searches PATH (or checks the literal path when it contains '/').
    static bool isExecutable(const std::string& program);
};

} // namespace nudger

#endif // NUDGER_PROCESS_HPP
