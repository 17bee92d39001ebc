#include "seisspec/log.hpp"
#include <cstdio>

namespace seisspec {
namespace log {

namespace {

void stderrSink(Level level, const std::string& message) {
    fmt::print(stderr, "[seisspec] [{}] {}\n", toString(level), message);
}

} // namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : sink_(stderrSink) {}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == Level::OFF || level < level_) {
        return;
    }
    sink_(level, message);
}

bool Logger::enabled(Level level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != Level::OFF && level >= level_;
}

Level Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : Sink(stderrSink);
}

} // namespace log
} // namespace seisspec
