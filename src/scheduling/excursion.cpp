#include "../include/scheduling/excursion.hpp"
#include "../include/utils/process.hpp"

#include <utility>

namespace nudger {

bool ProcessResource::isClosed() {
    if (!closed_) {
        closed_ = Process::hasExited(pid_);
    }
    return closed_;
}

void ProcessResource::release() {
    if (closed_) return;
    Process::terminate(pid_, 200);
    closed_ = true;
}

std::string ProcessResource::describe() const {
    return "process " + std::to_string(pid_);
}

Excursion::Excursion(std::string fn, std::uint64_t generation)
    : fn_(std::move(fn)), generation_(generation) {
}

void Excursion::addResource(std::shared_ptr<AuxResource> resource) {
    if (resource) {
        resources_.push_back(std::move(resource));
    }
}

bool Excursion::allClosed() {
    for (const auto& resource : resources_) {
        if (!resource->isClosed()) return false;
    }
    return true;
}

void Excursion::release() {
    for (const auto& resource : resources_) {
        if (!resource->isClosed()) {
            resource->release();
        }
    }
}

} // namespace nudger
