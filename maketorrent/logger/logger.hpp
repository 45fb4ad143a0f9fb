#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace maketorrent::logger {

    enum class LogLevel : uint8_t { trace=0, debug=1, info=2, warn=3, error=4, none=255 };

    struct LogRecord
    {
        LogLevel level{LogLevel::info};
        std::chrono::system_clock::time_point ts{};
        std::string logger;        // e.g. "FileEnumerator", "HashScheduler"
        std::string msg;           // rendered text

        // Optional structured fields:
        std::string path;          // file being listed or read
        std::int64_t piece{-1};    // piece index
        std::int64_t bytes{-1};    // byte count
    };

    class ILoggerSink
    {
    public:
        virtual ~ILoggerSink() = default;
        virtual void write(const LogRecord& rec) = 0;
    };

    // One line per record on a stream; stderr by default so stdout stays free for output.
    class StreamSink : public ILoggerSink
    {
    public:
        explicit StreamSink(std::ostream& out = std::cerr) : out_(out) {}
        void write(const LogRecord& rec) override;
    private:
        std::ostream& out_;
    };

    class FileSink : public ILoggerSink
    {
    public:
        explicit FileSink(const std::string& path);
        void write(const LogRecord& rec) override;
    private:
        std::mutex mu_;
        std::ofstream out_;
    };

    std::string formatRecord(const LogRecord& rec);

    class Logger
    {
    public:
        explicit Logger(std::shared_ptr<ILoggerSink> sink = std::make_shared<StreamSink>())
        : sink_(std::move(sink)) {}

        void setLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }
        bool enabled(LogLevel lvl) const { return static_cast<unsigned>(lvl) >= static_cast<unsigned>(level()); }

        void log(LogRecord rec) {
            if (!enabled(rec.level)) return;
            rec.ts = std::chrono::system_clock::now();
            sink_->write(rec);
        }

        void trace(std::string msg, std::string logger = {}) { emit(LogLevel::trace, std::move(msg), std::move(logger)); }
        void debug(std::string msg, std::string logger = {}) { emit(LogLevel::debug, std::move(msg), std::move(logger)); }
        void info (std::string msg, std::string logger = {}) { emit(LogLevel::info , std::move(msg), std::move(logger)); }
        void warn (std::string msg, std::string logger = {}) { emit(LogLevel::warn , std::move(msg), std::move(logger)); }
        void error(std::string msg, std::string logger = {}) { emit(LogLevel::error, std::move(msg), std::move(logger)); }

    private:
        void emit(LogLevel lvl, std::string msg, std::string logger) {
            LogRecord rec;
            rec.level = lvl;
            rec.msg   = std::move(msg);
            rec.logger= std::move(logger);
            log(std::move(rec));
        }

        std::shared_ptr<ILoggerSink> sink_;
        std::atomic<LogLevel> level_{LogLevel::info};
    };

    using LoggerPtr = std::shared_ptr<Logger>;

    // Compile-time floor for MT_LOG; the runtime threshold still applies on top.
    #ifndef MT_LOG_LEVEL
    #define MT_LOG_LEVEL maketorrent::logger::LogLevel::debug
    #endif

    #define MT_LOG_ENABLED(lvl) (static_cast<unsigned>(lvl) >= static_cast<unsigned>(MT_LOG_LEVEL))

    // Usage: MT_LOG(loggerPtr, LogLevel::debug, "PieceSegmenter") << "piece " << i;
    #define MT_LOG(LOGGER_PTR, LVL, NAME) \
        if (!(LOGGER_PTR) || !MT_LOG_ENABLED(LVL) || !(LOGGER_PTR)->enabled(LVL)) ; \
        else ::maketorrent::logger::detail::LogStreamHelper(*(LOGGER_PTR), (LVL), (NAME), __LINE__, __func__).stream()

    namespace detail {
        class LogStreamHelper
        {
        public:
            LogStreamHelper(Logger& lg, LogLevel lvl, const char* name, int line, const char* fn)
            : lg_(lg) { ss_ << "[" << fn << ":" << line << "] "; rec_.level = lvl; rec_.logger = name; }
            ~LogStreamHelper() {
                rec_.msg = ss_.str();
                lg_.log(std::move(rec_));
            }
            std::ostream& stream() { return ss_; }
            LogRecord rec_;
        private:
            Logger& lg_;
            std::ostringstream ss_;
        };
    }

} // namespace maketorrent::logger
