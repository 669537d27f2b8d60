#pragma once
#include <string>
#include <vector>
#include <istream>
#include "element_set.hpp"

namespace rw {
    class TleReader {
    public:
        // Groups non-empty lines into catalog entries. Any line that is not an
        // element line ("1 ..." / "2 ...") opens a new entry; entries are not validated here.
        static std::vector<RawElementSet> parse(std::istream& in);

        // Throws std::runtime_error if the file cannot be opened
        static std::vector<RawElementSet> parseFile(const std::string& filepath);

        // Keep entries whose name contains one of the comma separated targets (case-insensitive)
        static std::vector<RawElementSet> selectByName(const std::vector<RawElementSet>& entries, const std::string& sat_names_csv);

    private:
        static bool isElementLine(const std::string& line);
        static std::string upper(std::string s);
    };
}
