// adfx_logger.h - adfx logging subsystem
//
// Verbosity levels (set via --log-level N or config yaml log-level):
//   1 = CRITICAL  - fatal errors, crash conditions
//   2 = ERROR     - non-fatal errors (device open failures, bad config)
//   3 = WARN      - warnings, degraded operation (unknown genre, effect bypass)
//   4 = INFO      - normal operational events (default)
//   5 = DEBUG     - verbose trace / source location
//
// Log files (all under /var/log/adfx/ by default):
//   error.log   - every message at or below the configured level
//   engine.log  - effect engine events (genre switches, effect faults)
//
// Rotation: external logrotate moves the files, then SIGHUP makes the host
// call rotate() to reopen them.
//
// Thread-safe. Multiple writers via mutex.
// Never call from the audio callback: every write takes the mutex and hits
// the filesystem.

#pragma once

#include <atomic>
#include <string>
#include <mutex>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

/* ── Log levels ─────────────────────────────────────────────────────────── */

enum AdfxLogLevel {
    ADFX_LOG_CRITICAL = 1,
    ADFX_LOG_ERROR    = 2,
    ADFX_LOG_WARN     = 3,
    ADFX_LOG_INFO     = 4,
    ADFX_LOG_DEBUG    = 5,
};

/* ── Logger class ───────────────────────────────────────────────────────── */

class AdfxLogger {
public:
    // Singleton access
    static AdfxLogger& instance() {
        static AdfxLogger inst;
        return inst;
    }

    // Configure log directory + level. Called once at startup.
    // Until init() runs, messages only go to stderr.
    void init(const std::string& log_dir, int level = ADFX_LOG_INFO,
              bool also_stderr = true)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        close_files();
        log_dir_    = log_dir;
        stderr_too_ = also_stderr;
        level_.store(level);
        ensure_dir(log_dir_);
        open_files();
    }

    // Read on every call without the mutex
    int  level() const    { return level_.load(); }
    void set_level(int l) { level_.store(l); }

    // ── Log helpers ──────────────────────────────────────────────────────

    void critical(const std::string& msg, const std::string& file = {},
                  int line = 0) { write(ADFX_LOG_CRITICAL, "CRIT ", msg, file, line); }

    void error   (const std::string& msg, const std::string& file = {},
                  int line = 0) { write(ADFX_LOG_ERROR,    "ERROR", msg, file, line); }

    void warn    (const std::string& msg, const std::string& file = {},
                  int line = 0) { write(ADFX_LOG_WARN,     "WARN ", msg, file, line); }

    void info    (const std::string& msg, const std::string& file = {},
                  int line = 0) { write(ADFX_LOG_INFO,     "INFO ", msg, file, line); }

    void debug   (const std::string& msg, const std::string& file = {},
                  int line = 0) { write(ADFX_LOG_DEBUG,    "DEBUG", msg, file, line); }

    // ── Engine event log ─────────────────────────────────────────────────

    void engine(const std::string& event, const std::string& detail = {})
    {
        if (level() < ADFX_LOG_INFO) return;
        std::lock_guard<std::mutex> lk(mtx_);
        std::string line = ts_now() + " " + event;
        if (!detail.empty()) line += " | " + detail;
        append(eng_f_, line);
        if (stderr_too_)
            fprintf(stderr, "[engine] %s %s\n", event.c_str(), detail.c_str());
    }

    // ── Rotate (reopen files after logrotate moved them; SIGHUP) ──────────

    void rotate() {
        std::lock_guard<std::mutex> lk(mtx_);
        close_files();
        open_files();
    }

private:
    AdfxLogger() = default;
    ~AdfxLogger() { close_files(); }
    AdfxLogger(const AdfxLogger&) = delete;
    AdfxLogger& operator=(const AdfxLogger&) = delete;

    std::mutex  mtx_;
    std::string log_dir_;
    std::atomic<int> level_{ADFX_LOG_INFO};
    bool        stderr_too_ = true;

    FILE* err_f_ = nullptr;   // error.log
    FILE* eng_f_ = nullptr;   // engine.log

    static std::string ts_now() {
        char ts[32];
        time_t now = time(nullptr);
        struct tm tm_buf;
        strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%SZ", gmtime_r(&now, &tm_buf));
        return ts;
    }

    static void ensure_dir(const std::string& dir) {
        struct stat st;
        if (!dir.empty() && ::stat(dir.c_str(), &st) != 0)
            ::mkdir(dir.c_str(), 0755);
    }

    void open_files() {
        if (log_dir_.empty()) return;
        err_f_ = fopen((log_dir_ + "/error.log").c_str(),  "a");
        eng_f_ = fopen((log_dir_ + "/engine.log").c_str(), "a");
        if (!err_f_ || !eng_f_)
            fprintf(stderr, "[log] Cannot open log files in %s - stderr only\n",
                    log_dir_.c_str());
    }

    void close_files() {
        if (err_f_) { fclose(err_f_); err_f_ = nullptr; }
        if (eng_f_) { fclose(eng_f_); eng_f_ = nullptr; }
    }

    void append(FILE*& f, const std::string& line) {
        if (!f) return;
        fprintf(f, "%s\n", line.c_str());
        fflush(f);
    }

    void write(int req_level, const char* tag,
               const std::string& msg,
               const std::string& src_file, int src_line)
    {
        if (req_level > level()) return;
        std::lock_guard<std::mutex> lk(mtx_);

        std::string entry = ts_now();
        entry += " ["; entry += tag; entry += "] ";
        entry += msg;

        if (level() >= ADFX_LOG_DEBUG && !src_file.empty()) {
            // Strip path prefix for readability
            size_t sl = src_file.rfind('/');
            entry += " (";
            entry += (sl == std::string::npos ? src_file : src_file.substr(sl + 1));
            entry += ":";
            entry += std::to_string(src_line);
            entry += ")";
        }

        append(err_f_, entry);

        if (stderr_too_) {
            fprintf(stderr, "%s\n", entry.c_str());
        }
    }
};

/* ── Global logger accessor + convenience macros ─────────────────────────── */

#define adfxlog   (AdfxLogger::instance())

#define ADFX_CRIT(msg)  adfxlog.critical((msg), __FILE__, __LINE__)
#define ADFX_ERR(msg)   adfxlog.error   ((msg), __FILE__, __LINE__)
#define ADFX_WARN(msg)  adfxlog.warn    ((msg), __FILE__, __LINE__)
#define ADFX_INFO(msg)  adfxlog.info    ((msg), __FILE__, __LINE__)
#define ADFX_DBG(msg)   adfxlog.debug   ((msg), __FILE__, __LINE__)

// Stream-style helper for building log messages inline
#define ADFX_LOG(level, ...) do { \
    std::ostringstream _adfx_ss; \
    _adfx_ss << __VA_ARGS__; \
    adfxlog.level(_adfx_ss.str(), __FILE__, __LINE__); \
} while(0)
