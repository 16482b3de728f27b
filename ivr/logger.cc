#include "logger.h"

ivr::Logger::Logger(std::ostream &out, std::ostream &err, Level level) :
    out_(out),
    err_(err),
    level_(level)
{
}

void ivr::Logger::setLevel(Level level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

ivr::Logger::Level ivr::Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool ivr::Logger::isEnabled(Level level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_;
}

void ivr::Logger::debug(const std::string &msg)
{
    log(Level::Debug, msg);
}

void ivr::Logger::info(const std::string &msg)
{
    log(Level::Info, msg);
}

void ivr::Logger::warning(const std::string &msg)
{
    log(Level::Warning, msg);
}

void ivr::Logger::error(const std::string &msg)
{
    log(Level::Error, msg);
}

void ivr::Logger::log(Level level, const std::string &msg)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
        return;
    }

    switch (level) {
    case Level::Debug:
        out_ << "--- " << msg << std::endl;
        break;
    case Level::Info:
        out_ << "*** " << msg << std::endl;
        break;
    case Level::Warning:
    case Level::Error:
        err_ << "!!! " << msg << std::endl;
        break;
    }
}

const char *ivr::toString(Logger::Level level)
{
    switch (level) {
    case Logger::Level::Debug:
        return "debug";
    case Logger::Level::Info:
        return "info";
    case Logger::Level::Warning:
        return "warning";
    case Logger::Level::Error:
        return "error";
    }
    return "unknown";
}
