#include "../include/app/instance_lock.hpp"
#include "../include/utils/logger.hpp"

#include <boost/filesystem.hpp>

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <utility>

namespace fs = boost::filesystem;

namespace nudger {

InstanceLock::InstanceLock(std::string path) : path_(std::move(path)) {
}

InstanceLock::~InstanceLock() {
    release();
}

bool InstanceLock::acquire() {
    if (held_) return true;

    pid_t other = owner();
    if (other != 0 && other != ::getpid()) {
        Logger::getInstance().warning("InstanceLock: another instance is running (pid " +
                                      std::to_string(other) + ")");
        return false;
    }

    boost::system::error_code ec;
    fs::create_directories(fs::path(path_).parent_path(), ec);
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        Logger::getInstance().warning("InstanceLock: cannot write " + path_);
        return false;
    }
    out << ::getpid() << "\n";
    out.close();
    held_ = static_cast<bool>(out);
    return held_;
}

void InstanceLock::release() {
    if (!held_) return;
    held_ = false;
    if (owner() == ::getpid()) {
        boost::system::error_code ec;
        fs::remove(path_, ec);
    }
}

pid_t InstanceLock::owner() const {
    std::ifstream in(path_);
    if (!in) return 0;
    long pid = 0;
    if (!(in >> pid) || pid <= 0) return 0;
    if (::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM) {
        return static_cast<pid_t>(pid);
    }
    return 0;
}

} // namespace nudger
