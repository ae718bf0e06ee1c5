#ifndef NUDGER_INSTANCE_LOCK_HPP
#define NUDGER_INSTANCE_LOCK_HPP

#include <sys/types.h>
#include <string>

namespace nudger {

// Best-effort PID marker file. Not a real lock: two processes starting at
// the same instant can both succeed.
class InstanceLock {
public:
    explicit InstanceLock(std::string path);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    // False if another live process holds the marker.
    bool acquire();
    void release();
    bool held() const { return held_; }

    // PID recorded in the marker if that process is alive, else 0.
    pid_t owner() const;

private:
    std::string path_;
    bool held_ = false;
};

} // namespace nudger

#endif // NUDGER_INSTANCE_LOCK_HPP
