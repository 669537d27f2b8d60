#include "tle_reader.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rw {
    bool TleReader::isElementLine(const std::string& line) {
        return line.size() >= 2 && (line[0] == '1' || line[0] == '2') && line[1] == ' ';
    }

    std::string TleReader::upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
        return s;
    }

    std::vector<RawElementSet> TleReader::parse(std::istream& in) {
        std::vector<RawElementSet> entries;
        RawElementSet current;
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line); if (line.empty()) continue;
            if (isElementLine(line)) {
                // A line 1 after a complete or already-started set opens a nameless entry
                bool has_line1 = std::any_of(current.begin(), current.end(),
                                             [](const std::string& l) { return isElementLine(l) && l[0] == '1'; });
                if (line[0] == '1' && (current.size() >= 3 || has_line1)) {
                    entries.push_back(std::move(current));
                    current.clear();
                }
                current.push_back(line);
            } else {
                if (!current.empty()) entries.push_back(std::move(current));
                current = RawElementSet{line};
            }
        }
        if (!current.empty()) entries.push_back(std::move(current));
        return entries;
    }

    std::vector<RawElementSet> TleReader::parseFile(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) throw std::runtime_error("Cannot open TLE file: " + filepath);
        auto entries = parse(file);
        Logger::log("Read " + std::to_string(entries.size()) + " catalog entries from " + filepath);
        return entries;
    }

    std::vector<RawElementSet> TleReader::selectByName(const std::vector<RawElementSet>& entries, const std::string& sat_names_csv) {
        std::vector<std::string> targets;
        std::stringstream ss(sat_names_csv);
        std::string seg;
        while (std::getline(ss, seg, ',')) { std::string c = trim(seg); if (!c.empty()) targets.push_back(upper(c)); }
        if (targets.empty()) return entries;

        std::vector<RawElementSet> results;
        for (const auto& entry : entries) {
            if (entry.empty()) continue;
            std::string check_name = upper(entry.front());
            bool match = std::any_of(targets.begin(), targets.end(),
                                     [&](const std::string& t) { return check_name.find(t) != std::string::npos; });
            if (match) results.push_back(entry);
        }
        return results;
    }
}
