#include "beam_analysis/core/events.hpp"
#include "beam_analysis/core/utils.hpp"

namespace beam_analysis::core {

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR: return "error";
        default: return "unknown";
    }
}

LogLevel log_level_from_verbosity(int verbosity) {
    if (verbosity >= 2) return LogLevel::DEBUG;
    if (verbosity == 1) return LogLevel::INFO;
    return LogLevel::WARNING;
}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, std::ostream& out) {
    if (!enabled(LogLevel::INFO)) return;
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    // Failed phases are always reported
    if (status == "ok" && !enabled(LogLevel::INFO)) return;
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::log(const std::string& run_id, LogLevel level, const std::string& message,
                       const json& extra, std::ostream& out) {
    if (!enabled(level)) return;
    json event = base_event("log", run_id);
    event["level"] = log_level_to_string(level);
    event["message"] = message;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::debug(const std::string& run_id, const std::string& message,
                         const json& extra, std::ostream& out) {
    log(run_id, LogLevel::DEBUG, message, extra, out);
}

void EventEmitter::info(const std::string& run_id, const std::string& message, std::ostream& out) {
    log(run_id, LogLevel::INFO, message, json::object(), out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    if (!enabled(LogLevel::WARNING)) return;
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace beam_analysis::core
