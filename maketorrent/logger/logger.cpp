// logger.cpp
#include "logger.hpp"
#include <syncstream>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace maketorrent::logger {

    static const char* level_name(LogLevel l) {
        switch (l) {
            case LogLevel::trace: return "TRACE";
            case LogLevel::debug: return "DEBUG";
            case LogLevel::info:  return "INFO";
            case LogLevel::warn:  return "WARN";
            case LogLevel::error: return "ERROR";
            default:              return "NONE";
        }
    }

    static std::string ts_iso8601(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::string formatRecord(const LogRecord& rec) {
        std::ostringstream out;
        out << ts_iso8601(rec.ts) << " [" << level_name(rec.level) << "] "
            << (rec.logger.empty() ? "maketorrent" : rec.logger) << ": "
            << rec.msg;

        if (!rec.path.empty()) out << " path="  << rec.path;
        if (rec.piece >= 0)    out << " piece=" << rec.piece;
        if (rec.bytes >= 0)    out << " bytes=" << rec.bytes;

        out << '\n';
        return out.str();
    }

    // -------- StreamSink: atomic per-line emission --------
    void StreamSink::write(const LogRecord& rec) {
        std::osyncstream out(out_);  // per-call buffered; flushes on destruction
        out << formatRecord(rec);
    }

    // -------- FileSink: mutex-serialized writes --------
    FileSink::FileSink(const std::string& path) : out_(path, std::ios::app) {}

    void FileSink::write(const LogRecord& rec) {
        if (!out_) return;
        std::scoped_lock lk(mu_);
        out_ << formatRecord(rec);
        out_.flush();
    }

} // namespace maketorrent::logger
