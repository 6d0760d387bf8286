#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace panel_layout::core {

using json = nlohmann::json;

class EventEmitter {
public:
    EventEmitter() = default;
    explicit EventEmitter(bool enabled) : enabled_(enabled) {}

    void run_start(const std::string& run_id, Command command, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void panels_sorted(const std::string& run_id, int panel_count, int column_count,
                       int spanning_count, float gap_tolerance, bool rtl_order,
                       std::ostream& out);
    void border_located(const std::string& run_id, int x, int y, int width, int height,
                        std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);

    bool enabled_ = true;
};

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out);

} // namespace panel_layout::core
