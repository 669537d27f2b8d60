#include "element_set.hpp"
#include <algorithm>

namespace rw {
    std::string trim(const std::string& str) {
        std::string s = str;
        s.erase(std::remove(s.begin(), s.end(), '\r'), s.end());
        s.erase(std::remove(s.begin(), s.end(), '\n'), s.end());
        size_t first = s.find_first_not_of(" \t");
        if (std::string::npos == first) return "";
        size_t last = s.find_last_not_of(" \t");
        return s.substr(first, (last - first + 1));
    }

    OrbitalElementSet::OrbitalElementSet(std::string name, std::string line1, std::string line2)
        : name_(trim(name)), line1_(trim(line1)), line2_(trim(line2)) {
        if (name_.empty()) throw ElementSetError("Element set has an empty name line");
        if (line1_.empty() || line2_.empty())
            throw ElementSetError("Element set [" + name_ + "] has an empty element line");
        if (line1_.compare(0, 2, "1 ") != 0)
            throw ElementSetError("Element set [" + name_ + "] line 1 does not start with '1 '");
        if (line2_.compare(0, 2, "2 ") != 0)
            throw ElementSetError("Element set [" + name_ + "] line 2 does not start with '2 '");
    }

    OrbitalElementSet OrbitalElementSet::fromLines(const RawElementSet& lines) {
        if (lines.size() != 3) {
            std::string label = lines.empty() ? std::string("<empty>") : trim(lines.front());
            throw ElementSetError("Element set [" + label + "] has " + std::to_string(lines.size()) +
                                  " lines, expected 3 (name, line 1, line 2)");
        }
        return OrbitalElementSet(lines[0], lines[1], lines[2]);
    }
}
