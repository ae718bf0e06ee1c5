#ifndef NUDGER_EXCURSION_HPP
#define NUDGER_EXCURSION_HPP

#include <sys/types.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nudger {

// Something an excursion opened for the user (a helper process, an editor
// buffer, a window). The excursion completes once all of them are closed.
class AuxResource {
public:
    virtual ~AuxResource() = default;
    virtual bool isClosed() = 0;
    virtual std::string describe() const = 0;
    // Called when the excursion is abandoned while the resource is still open.
    virtual void release() {}
};

class ProcessResource : public AuxResource {
public:
    explicit ProcessResource(pid_t pid) : pid_(pid) {}

    bool isClosed() override;
    std::string describe() const override;
    void release() override;
    pid_t pid() const { return pid_; }

private:
    pid_t pid_;
    bool closed_ = false;
};

/**
 * Handle given to an excursion body. The body registers the resources it
 * opened; the scheduler watches them and the cancel flag.
 */
class Excursion {
public:
    Excursion(std::string fn, std::uint64_t generation);

    void addResource(std::shared_ptr<AuxResource> resource);
    void cancel() { cancelled_ = true; }

    bool cancelled() const { return cancelled_; }
    bool allClosed();
    // Releases every resource that is not closed yet.
    void release();
    std::size_t resourceCount() const { return resources_.size(); }
    const std::string& fn() const { return fn_; }
    std::uint64_t generation() const { return generation_; }

private:
    std::string fn_;
    std::uint64_t generation_;
    bool cancelled_ = false;
    std::vector<std::shared_ptr<AuxResource>> resources_;
};

} // namespace nudger

#endif // NUDGER_EXCURSION_HPP
