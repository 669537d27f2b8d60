#include "logger.hpp"
#include <ctime>
#include <iomanip>

namespace rw {
    std::ofstream Logger::log_file_("rw_log.txt", std::ios::out | std::ios::app);
    std::mutex Logger::log_mutex_;

    static const char* levelTag(Logger::Level level) {
        switch (level) {
            case Logger::Level::DEBUG: return "DEBUG";
            case Logger::Level::WARN: return "WARN ";
            case Logger::Level::INFO:
            default: return "INFO ";
        }
    }

    bool Logger::open(const std::string& path) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (log_file_.is_open()) log_file_.close();
        log_file_.open(path, std::ios::out | std::ios::app);
        return log_file_.is_open();
    }

    void Logger::write(Level level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (log_file_.is_open()) {
            std::time_t now = std::time(nullptr);
            std::tm local_tm{};
            localtime_r(&now, &local_tm);
            log_file_ << "[" << std::put_time(&local_tm, "%T") << "] " << levelTag(level) << " " << msg << std::endl;
        }
    }
}
