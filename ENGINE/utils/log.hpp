#pragma once

#include <string>

namespace mablocks::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

void set_level(Level level);
Level level();
Level parse_level(const std::string& value, Level fallback = Level::Info);

void reset_time_origin();

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

// Prefixes every message with "[component] ". One per translation unit.
class Channel {
public:
    explicit Channel(std::string component);

    const std::string& component() const { return component_; }
    std::string tagged(const std::string& message) const;

    void error(const std::string& message) const;
    void warn(const std::string& message) const;
    void info(const std::string& message) const;
    void debug(const std::string& message) const;

private:
    std::string component_;
    std::string prefix_;
};

}
