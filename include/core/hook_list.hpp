#ifndef NUDGER_HOOK_LIST_HPP
#define NUDGER_HOOK_LIST_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "../utils/logger.hpp"

namespace nudger {

/**
 * Ordered chain of named handlers. Handlers run in registration order;
 * a handler that throws is logged and the chain continues.
 */
template <typename... Args>
class HookList {
public:
    using Handler = std::function<void(Args...)>;

    explicit HookList(std::string name) : name_(std::move(name)) {}

    void add(const std::string& handler_name, Handler handler) {
        handlers_.push_back({handler_name, std::move(handler)});
    }

    bool remove(const std::string& handler_name) {
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->first == handler_name) {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    // Returns the number of handlers that failed.
    std::size_t run(Args... args) const {
        std::size_t failures = 0;
        for (const auto& entry : handlers_) {
            try {
                entry.second(args...);
            } catch (const std::exception& e) {
                ++failures;
                Logger::getInstance().warning(name_ + ": handler " + entry.first +
                                              " failed: " + e.what());
            }
        }
        return failures;
    }

    std::size_t size() const { return handlers_.size(); }
    bool empty() const { return handlers_.empty(); }

private:
    std::string name_;
    std::vector<std::pair<std::string, Handler>> handlers_;
};

} // namespace nudger

#endif // NUDGER_HOOK_LIST_HPP
