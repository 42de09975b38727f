#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <vector>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

namespace {

struct LogMessage {
    LogLevel level;
    std::string msg;
    std::map<std::string, std::string> fields;
};

std::ofstream g_log_ofs;
std::string g_log_path; // NOLINT(runtime/string)
std::atomic<LogLevel> g_min_level{LogLevel::INFO};
std::atomic<size_t> g_max_size{0};
std::atomic<size_t> g_max_files{1};
std::atomic<bool> g_json_log{false};
std::atomic<bool> g_compress_logs{false};
std::atomic<bool> g_console{true};
std::atomic<bool> g_syslog{false};

std::mutex g_secret_mtx;
std::vector<std::string> g_secrets;

// Guards the sinks; held by whichever thread is writing an entry.
std::mutex g_sink_mtx;

std::deque<LogMessage> g_queue;
std::mutex g_queue_mtx;
std::condition_variable g_queue_cv;
std::condition_variable g_drained_cv;
size_t g_in_flight = 0;
bool g_running = false;
std::thread g_log_thread;
std::mutex g_init_mtx;

const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

#ifdef __linux__
int syslog_priority(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return LOG_DEBUG;
    case LogLevel::INFO:
        return LOG_INFO;
    case LogLevel::WARNING:
        return LOG_WARNING;
    case LogLevel::ERR:
        return LOG_ERR;
    }
    return LOG_INFO;
}
#endif

std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::string format_line(const LogMessage& m) {
    std::string ts = timestamp();
    std::string line;
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + level_label(m.level) +
               "\",\"msg\":\"" + json_escape(m.msg) + "\"";
        for (const auto& [k, v] : m.fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + ts + "] [" + level_label(m.level) + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
    }
    return line;
}

bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

// Shift log.N -> log.N+1 (dropping the oldest), then move the active file to
// log.1, compressing it when requested. Caller holds g_sink_mtx.
void rotate_files() {
    std::error_code ec;
    g_log_ofs.close();
    const size_t keep = g_max_files.load();
    if (keep > 0) {
        const std::string suffix = g_compress_logs.load() ? ".gz" : "";
        auto nth = [&](size_t i) { return fs::path(g_log_path + "." + std::to_string(i) + suffix); };
        fs::remove(nth(keep), ec);
        for (size_t i = keep; i > 1; --i)
            fs::rename(nth(i - 1), nth(i), ec);
        fs::path first = g_log_path + ".1";
        fs::rename(g_log_path, first, ec);
        if (g_compress_logs.load()) {
            fs::path gz = first;
            gz += ".gz";
            if (gzip_file(first.string(), gz.string()))
                fs::remove(first, ec);
        }
    } else {
        fs::remove(g_log_path, ec);
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

void write_entry(const LogMessage& m) {
    std::string line = format_line(m);
    std::lock_guard<std::mutex> lk(g_sink_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs << line << '\n';
        g_log_ofs.flush();
        if (g_max_size.load() > 0) {
            std::error_code ec;
            auto size = fs::file_size(g_log_path, ec);
            if (!ec && size > g_max_size.load())
                rotate_files();
        }
    }
    if (g_console.load())
        std::cerr << line << std::endl;
#ifdef __linux__
    if (g_syslog.load())
        syslog(syslog_priority(m.level), "%s", line.c_str());
#endif
}

void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_queue.empty() || !g_running; });
        if (!g_running && g_queue.empty())
            break;
        while (!g_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_queue.front()));
            g_queue.pop_front();
        }
        lk.unlock();
        for (const auto& m : batch)
            write_entry(m);
        lk.lock();
        g_in_flight -= batch.size();
        batch.clear();
        if (g_in_flight == 0)
            g_drained_cv.notify_all();
    }
}

void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running = false;
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

void dispatch(LogLevel level, const std::string& msg, std::map<std::string, std::string> fields) {
    if (level < g_min_level.load())
        return;
    LogMessage m{level, redact_secrets(msg), {}};
    for (auto& [k, v] : fields)
        m.fields.emplace(k, redact_secrets(v));
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (g_running) {
            g_queue.push_back(std::move(m));
            ++g_in_flight;
            g_queue_cv.notify_one();
            return;
        }
    }
    // No writer thread yet (startup errors, tests): write synchronously.
    write_entry(m);
}

} // namespace

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    {
        std::lock_guard<std::mutex> slk(g_sink_mtx);
        if (g_log_ofs.is_open())
            g_log_ofs.close();
        g_log_ofs.clear();
        g_log_path = path;
        if (!path.empty()) {
            g_log_ofs.open(path, std::ios::app);
            if (!g_log_ofs.is_open())
                std::cerr << "Failed to open log file: " << path << std::endl;
        }
    }
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_min_level.store(level);
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running = true;
    }
    g_log_thread = std::thread(log_worker);
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    openlog("selfsync", LOG_PID | LOG_CONS, facility == 0 ? LOG_DAEMON : facility);
    g_syslog.store(true);
}
#else
void init_syslog(int) {}
#endif

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "DEBUG")
        out = LogLevel::DEBUG;
    else if (v == "INFO")
        out = LogLevel::INFO;
    else if (v == "WARNING" || v == "WARN")
        out = LogLevel::WARNING;
    else if (v == "ERROR" || v == "ERR" || v == "CRITICAL")
        out = LogLevel::ERR;
    else
        return false;
    return true;
}

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_log_console(bool enable) { g_console.store(enable); }

void add_log_secret(const std::string& secret) {
    if (secret.empty())
        return;
    std::lock_guard<std::mutex> lk(g_secret_mtx);
    if (std::find(g_secrets.begin(), g_secrets.end(), secret) == g_secrets.end())
        g_secrets.push_back(secret);
}

void clear_log_secrets() {
    std::lock_guard<std::mutex> lk(g_secret_mtx);
    g_secrets.clear();
}

std::string redact_secrets(const std::string& text) {
    std::lock_guard<std::mutex> lk(g_secret_mtx);
    std::string out = text;
    for (const auto& s : g_secrets) {
        size_t pos = 0;
        while ((pos = out.find(s, pos)) != std::string::npos) {
            out.replace(pos, s.size(), "***");
            pos += 3;
        }
    }
    return out;
}

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_sink_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait(lk, [] { return g_in_flight == 0 || !g_running; });
}

void log_debug(const std::string& msg) { dispatch(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::string& data) {
    dispatch(LogLevel::DEBUG, msg, data.empty() ? std::map<std::string, std::string>{}
                                                : std::map<std::string, std::string>{{"data", data}});
}
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    dispatch(LogLevel::DEBUG, msg, fields);
}

void log_info(const std::string& msg) { dispatch(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::string& data) {
    dispatch(LogLevel::INFO, msg, data.empty() ? std::map<std::string, std::string>{}
                                               : std::map<std::string, std::string>{{"data", data}});
}
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    dispatch(LogLevel::INFO, msg, fields);
}

void log_warning(const std::string& msg) { dispatch(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::string& data) {
    dispatch(LogLevel::WARNING, msg,
             data.empty() ? std::map<std::string, std::string>{}
                          : std::map<std::string, std::string>{{"data", data}});
}
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    dispatch(LogLevel::WARNING, msg, fields);
}

void log_error(const std::string& msg) { dispatch(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::string& data) {
    dispatch(LogLevel::ERR, msg, data.empty() ? std::map<std::string, std::string>{}
                                              : std::map<std::string, std::string>{{"data", data}});
}
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    dispatch(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    {
        std::lock_guard<std::mutex> slk(g_sink_mtx);
        if (g_log_ofs.is_open()) {
            g_log_ofs.flush();
            g_log_ofs.close();
        }
    }
#ifdef __linux__
    if (g_syslog.exchange(false))
        closelog();
#endif
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    g_queue.clear();
    g_in_flight = 0;
    g_drained_cv.notify_all();
}
