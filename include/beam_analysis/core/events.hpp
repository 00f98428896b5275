#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace beam_analysis::core {

using json = nlohmann::json;

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

std::string log_level_to_string(LogLevel level);

// Maps -v / -vv style verbosity counts to a minimum level.
LogLevel log_level_from_verbosity(int verbosity);

class EventEmitter {
public:
    EventEmitter() = default;
    explicit EventEmitter(LogLevel min_level) : min_level_(min_level) {}

    LogLevel min_level() const { return min_level_; }
    void set_min_level(LogLevel level) { min_level_ = level; }
    bool enabled(LogLevel level) const { return level >= min_level_; }

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    // Phase events are INFO level
    void phase_start(const std::string& run_id, Phase phase, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void log(const std::string& run_id, LogLevel level, const std::string& message,
             const json& extra, std::ostream& out);
    void debug(const std::string& run_id, const std::string& message, const json& extra, std::ostream& out);
    void info(const std::string& run_id, const std::string& message, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);

    LogLevel min_level_ = LogLevel::WARNING;
};

} // namespace beam_analysis::core
