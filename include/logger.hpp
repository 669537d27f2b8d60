#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace rw {
    class Logger {
    public:
        enum class Level { DEBUG, INFO, WARN };

        // Redirects output to another file (appending). Default is rw_log.txt.
        static bool open(const std::string& path);
        static void log(const std::string& msg) { write(Level::INFO, msg); }
        static void warn(const std::string& msg) { write(Level::WARN, msg); }
        static void debug(const std::string& msg) { write(Level::DEBUG, msg); }
        static void write(Level level, const std::string& msg);
    private:
        static std::ofstream log_file_;
        static std::mutex log_mutex_;
    };
}
