#include "panel_layout/core/events.hpp"
#include "panel_layout/core/utils.hpp"

namespace panel_layout::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    if (!enabled_) return;
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, Command command,
                             const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    event["command"] = command_to_string(command);
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

void EventEmitter::panels_sorted(const std::string& run_id, int panel_count, int column_count,
                                 int spanning_count, float gap_tolerance, bool rtl_order,
                                 std::ostream& out) {
    json event = base_event("panels_sorted", run_id);
    event["panels"] = panel_count;
    event["columns"] = column_count;
    event["spanning"] = spanning_count;
    event["gap_tolerance_px"] = gap_tolerance;
    event["direction"] = rtl_order ? "rtl" : "ltr";
    emit(event, out);
}

void EventEmitter::border_located(const std::string& run_id, int x, int y, int width, int height,
                                  std::ostream& out) {
    json event = base_event("border_located", run_id);
    event["inner_rect"] = {
        {"x", x}, {"y", y}, {"w", width}, {"h", height}
    };
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
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

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out) {
    json event = {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
    for (auto& [key, value] : data.items()) {
        event[key] = value;
    }
    out << event.dump() << "\n";
    out.flush();
}

} // namespace panel_layout::core
