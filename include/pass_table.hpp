#pragma once
#include <string>
#include <vector>
#include <ostream>
#include <optional>
#include "pass_detector.hpp"

namespace rw {
    class PassTable {
    public:
        static const std::vector<std::string>& columns();

        void append(const std::vector<PassRecord>& records);
        const std::vector<PassRecord>& rows() const { return rows_; }
        size_t size() const { return rows_.size(); }
        bool empty() const { return rows_.empty(); }

        // One string per column, in columns() order
        static std::vector<std::string> formatRow(const PassRecord& record);

        void writeCsv(std::ostream& out) const;
        // Throws std::runtime_error if the file cannot be written
        void writeCsvFile(const std::string& path) const;

    private:
        std::vector<PassRecord> rows_;
    };

    // Fixed 3 decimals; empty string when there is no value
    std::string formatValue(const std::optional<double>& value);
    std::string csvEscape(const std::string& field);
}
