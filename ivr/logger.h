#ifndef _LOGGER_H_
#define _LOGGER_H_

#include <iostream>
#include <mutex>
#include <string>

namespace ivr {

class Logger
{
public:
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    Logger(std::ostream &out = std::cout, std::ostream &err = std::cerr, Level level = Level::Info);

    void setLevel(Level level);
    Level level() const;
    bool isEnabled(Level level) const;

    void debug(const std::string &msg);
    void info(const std::string &msg);
    void warning(const std::string &msg);
    void error(const std::string &msg);

    void log(Level level, const std::string &msg);

private:
    std::ostream &out_;
    std::ostream &err_;
    Level level_;
    mutable std::mutex mutex_;
};

const char *
toString(Logger::Level level);

} // namespace ivr

#endif // _LOGGER_H_
