#include "pass_table.hpp"
#include "logger.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace rw {
    const std::vector<std::string>& PassTable::columns() {
        static const std::vector<std::string> cols = {
            "Common Name",
            "Start Time (local)", "Start Latitude (deg)", "Start Longitude (deg)",
            "Start Altitude (km)", "Start Horizontal Velocity (km/s)",
            "Stop Time (local)", "Stop Latitude (deg)", "Stop Longitude (deg)",
            "Stop Altitude (km)", "Stop Horizontal Velocity (km/s)",
            "Duration (sec)"
        };
        return cols;
    }

    std::string formatValue(const std::optional<double>& value) {
        if (!value || !std::isfinite(*value)) return "";
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(3) << *value;
        std::string s = ss.str();
        if (s == "-0.000") s = "0.000";
        return s;
    }

    std::string csvEscape(const std::string& field) {
        if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
        std::string quoted = "\"";
        for (char c : field) {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    void PassTable::append(const std::vector<PassRecord>& records) {
        rows_.insert(rows_.end(), records.begin(), records.end());
    }

    std::vector<std::string> PassTable::formatRow(const PassRecord& r) {
        const GeoSample& a = r.entry.sample;
        const GeoSample& b = r.exit.sample;
        return {
            r.entry.name,
            r.entry.local_time, formatValue(a.lat_deg), formatValue(a.lon_deg),
            formatValue(a.alt_km), formatValue(a.horiz_vel_kms),
            r.exit.local_time, formatValue(b.lat_deg), formatValue(b.lon_deg),
            formatValue(b.alt_km), formatValue(b.horiz_vel_kms),
            std::to_string(r.duration_sec)
        };
    }

    static void writeLine(std::ostream& out, const std::vector<std::string>& fields) {
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) out << ',';
            out << csvEscape(fields[i]);
        }
        out << "\n";
    }

    void PassTable::writeCsv(std::ostream& out) const {
        writeLine(out, columns());
        for (const auto& r : rows_) writeLine(out, formatRow(r));
    }

    void PassTable::writeCsvFile(const std::string& path) const {
        std::ofstream file(path);
        if (!file.is_open()) throw std::runtime_error("Cannot write CSV file: " + path);
        writeCsv(file);
        file.close();
        if (file.fail()) throw std::runtime_error("Failed writing CSV file: " + path);
        Logger::log("Wrote " + std::to_string(rows_.size()) + " passes to " + path);
    }
}
