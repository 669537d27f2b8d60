#pragma once
#include <string>
#include <vector>
#include <stdexcept>

namespace rw {
    class ElementSetError : public std::runtime_error {
    public:
        explicit ElementSetError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // Raw lines of one catalog entry, before validation
    using RawElementSet = std::vector<std::string>;

    class OrbitalElementSet {
    public:
        // Requires exactly name + line 1 + line 2, each non-empty after trimming.
        // Throws ElementSetError otherwise.
        static OrbitalElementSet fromLines(const RawElementSet& lines);
        OrbitalElementSet(std::string name, std::string line1, std::string line2);

        const std::string& getName() const { return name_; }
        const std::string& getLine1() const { return line1_; }
        const std::string& getLine2() const { return line2_; }

    private:
        std::string name_;
        std::string line1_;
        std::string line2_;
    };

    std::string trim(const std::string& str);
}
