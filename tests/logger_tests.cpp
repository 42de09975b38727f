#include <zlib.h>
#include <string>
#include <vector>
#include "test_common.hpp"

namespace {

struct LoggerGuard {
    LoggerGuard() { set_log_console(false); }
    ~LoggerGuard() {
        shutdown_logger();
        set_log_console(true);
        set_json_logging(false);
        set_log_compression(false);
        clear_log_secrets();
    }
};

std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream ifs(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

} // namespace

TEST_CASE("Logger rotates and limits files") {
    fs::path log = fs::temp_directory_path() / "selfsync_logger_rotate.log";
    fs::path log1 = log;
    log1 += ".1";
    fs::path log2 = log;
    log2 += ".2";
    fs::path log3 = log;
    log3 += ".3";
    for (const auto& p : {log, log1, log2, log3})
        fs::remove(p);

    LoggerGuard guard;
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    REQUIRE(logger_initialized());
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));
    REQUIRE_FALSE(fs::exists(log3));

    for (const auto& p : {log, log1, log2})
        fs::remove(p);
}

TEST_CASE("Logger compresses rotated files") {
    fs::path log = fs::temp_directory_path() / "selfsync_logger_compress.log";
    fs::path log1 = log;
    log1 += ".1.gz";
    fs::remove(log);
    fs::remove(log1);

    LoggerGuard guard;
    set_log_compression(true);
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();

    REQUIRE(fs::exists(log1));
    gzFile zf = gzopen(log1.c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[32];
    int n = gzread(zf, buf, sizeof(buf));
    gzclose(zf);
    REQUIRE(n > 0);

    fs::remove(log);
    fs::remove(log1);
    fs::path log2 = log;
    log2 += ".2.gz";
    fs::remove(log2);
}

TEST_CASE("Logger switches between JSON and plain") {
    fs::path log = fs::temp_directory_path() / "selfsync_logger_format.log";
    fs::remove(log);
    LoggerGuard guard;
    init_logger(log.string());
    set_json_logging(true);
    log_info("json entry", {{"k", std::string("v")}});
    flush_logger();
    set_json_logging(false);
    log_info("plain entry", {{"state", std::string("awaiting-child")}});
    flush_logger();
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0][0] == '{');
    REQUIRE(lines[0].find("\"k\":\"v\"") != std::string::npos);
    REQUIRE(lines[0].find("\"level\":\"INFO\"") != std::string::npos);
    REQUIRE(lines[1][0] == '[');
    REQUIRE(lines[1].find("[INFO] plain entry state=awaiting-child") != std::string::npos);
    fs::remove(log);
}

TEST_CASE("Logger filters by level") {
    fs::path log = fs::temp_directory_path() / "selfsync_logger_level.log";
    fs::remove(log);
    LoggerGuard guard;
    init_logger(log.string(), LogLevel::WARNING);
    log_debug("hidden debug");
    log_info("hidden info");
    log_warning("shown warning");
    log_error("shown error", "details");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("[WARNING] shown warning") != std::string::npos);
    REQUIRE(lines[1].find("[ERROR] shown error data=details") != std::string::npos);
    fs::remove(log);
}

TEST_CASE("Logger redacts registered secrets") {
    fs::path log = fs::temp_directory_path() / "selfsync_logger_secret.log";
    fs::remove(log);
    LoggerGuard guard;
    add_log_secret("ghp_topsecret");
    add_log_secret("");
    REQUIRE(redact_secrets("https://ghp_topsecret@github.com/o/r.git") ==
            "https://***@github.com/o/r.git");
    init_logger(log.string());
    log_warning("clone of https://ghp_topsecret@github.com/o/r.git failed",
                {{"error", std::string("auth failed for ghp_topsecret")}});
    shutdown_logger();
    std::string text = selfsync::test_support::read_file(log);
    REQUIRE(text.find("ghp_topsecret") == std::string::npos);
    REQUIRE(text.find("https://***@github.com") != std::string::npos);
    REQUIRE(text.find("auth failed for ***") != std::string::npos);
    clear_log_secrets();
    REQUIRE(redact_secrets("ghp_topsecret") == "ghp_topsecret");
    fs::remove(log);
}

TEST_CASE("parse_log_level accepts names case-insensitively") {
    LogLevel lvl = LogLevel::INFO;
    REQUIRE(parse_log_level("debug", lvl));
    REQUIRE(lvl == LogLevel::DEBUG);
    REQUIRE(parse_log_level("Warning", lvl));
    REQUIRE(lvl == LogLevel::WARNING);
    REQUIRE(parse_log_level("ERROR", lvl));
    REQUIRE(lvl == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("LOUD", lvl));
    REQUIRE(lvl == LogLevel::ERR);
}

TEST_CASE("shutdown_logger drains queued messages") {
    fs::path log = fs::temp_directory_path() / "selfsync_logger_drain.log";
    fs::remove(log);
    LoggerGuard guard;
    init_logger(log.string());
    for (int i = 0; i < 50; ++i)
        log_info("queued " + std::to_string(i));
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 50);
    REQUIRE_FALSE(logger_initialized());
    fs::remove(log);
}
