#pragma once

#include <atomic>
#include <initializer_list>
#include <mutex>
#include <ostream>
#include <set>
#include <string>

namespace gitty {

/// Diagnostic logger. Every message carries a set of tags; a message is
/// written only when logging is enabled, all of its tags are in the
/// enabled set (if that set is non-empty) and none is in the skip set.
class TaggedLogger {
public:
    TaggedLogger() = default;

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    void log(const std::string& message, const char* file, int line,
             std::initializer_list<std::string> tags);

    void setLoggingEnabled(bool enabled) { enabled_.store(enabled, std::memory_order_relaxed); }
    bool loggingEnabled() const { return enabled_.load(std::memory_order_relaxed); }

    /// Destination stream; nullptr restores stderr.
    void setOutput(std::ostream* out);

    void enableTag(const std::string& tag);
    void skipTag(const std::string& tag);
    void clearTagFilters();

private:
    static std::string shortPath(const char* file);

    std::atomic<bool> enabled_{false};
    std::ostream* out_ = nullptr;
    std::set<std::string> enabled_tags_;
    std::set<std::string> skip_tags_;
    mutable std::mutex mutex_;
};

TaggedLogger& logger();

void set_logging_enabled(bool enabled);

} // namespace gitty

#ifdef GITTY_LOG_DEBUG
#define gitty_log(message, ...)                                                     \
    do {                                                                            \
        if (::gitty::logger().loggingEnabled())                                     \
            ::gitty::logger().log((message), __FILE__, __LINE__, {__VA_ARGS__});    \
    } while (0)
#else
#define gitty_log(message, ...) ((void)0)
#endif // GITTY_LOG_DEBUG
