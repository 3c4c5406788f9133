#include "util/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace gitty {

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

void TaggedLogger::setOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out;
}

void TaggedLogger::enableTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_tags_.insert(tag);
}

void TaggedLogger::skipTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    skip_tags_.insert(tag);
}

void TaggedLogger::clearTagFilters() {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_tags_.clear();
    skip_tags_.clear();
}

std::string TaggedLogger::shortPath(const char* file) {
    std::string path = file ? file : "";
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return path;
    auto parent = path.find_last_of('/', slash == 0 ? 0 : slash - 1);
    return parent == std::string::npos ? path : path.substr(parent + 1);
}

void TaggedLogger::log(const std::string& message, const char* file, int line,
                       std::initializer_list<std::string> tags) {
    if (!loggingEnabled()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_tags_.empty()) {
        for (const auto& tag : tags)
            if (!enabled_tags_.count(tag))
                return;
    }
    for (const auto& tag : tags)
        if (skip_tags_.count(tag))
            return;

    const auto now      = std::chrono::system_clock::now();
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << nowMs.count() << ' ';
    oss << '[';
    bool first = true;
    for (const auto& tag : tags) {
        if (!first) oss << "][";
        oss << tag;
        first = false;
    }
    oss << "] ";
    oss << '[' << shortPath(file) << ':' << line << "] ";
    oss << message << '\n';

    std::ostream& out = out_ ? *out_ : std::cerr;
    out << oss.str() << std::flush;
}

} // namespace gitty
