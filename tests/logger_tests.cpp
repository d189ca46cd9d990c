#include <zlib.h>
#include <cstdarg>
#include <cstdio>
#ifdef __linux__
#include <syslog.h>
#endif
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "test_common.hpp"
#ifdef __linux__
static std::vector<std::string> g_syslog_messages;
extern "C" void openlog(const char*, int, int) {}
extern "C" void syslog(int, const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    g_syslog_messages.emplace_back(buf);
}
extern "C" void closelog() {}
#endif

struct LoggerGuard {
    ~LoggerGuard() {
        shutdown_logger();
        set_log_level(LogLevel::INFO);
    }
};

/// Captures everything written to std::cerr while alive.
struct CerrCapture {
    std::ostringstream out;
    std::streambuf* prev;
    CerrCapture() : prev(std::cerr.rdbuf(out.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(prev); }
};

static std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream ifs(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

TEST_CASE("parse_log_level names") {
    LogLevel level = LogLevel::INFO;
    REQUIRE(parse_log_level("DEBUG", level));
    REQUIRE(level == LogLevel::DEBUG);
    REQUIRE(parse_log_level("warn", level));
    REQUIRE(level == LogLevel::WARNING);
    REQUIRE(parse_log_level("error", level));
    REQUIRE(level == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("loud", level));
    REQUIRE(level == LogLevel::ERR);
}

TEST_CASE("Logger rotates and limits files") {
    fs::path log = fs::temp_directory_path() / "watchrun_rotate.log";
    fs::path log1 = log;
    log1 += ".1";
    fs::path log2 = log;
    log2 += ".2";
    fs::path log3 = log;
    log3 += ".3";
    for (const auto& p : {log, log1, log2, log3})
        FS_REMOVE(p);

    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
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
        FS_REMOVE(p);
}

TEST_CASE("Logger compresses rotated files") {
    fs::path log = fs::temp_directory_path() / "watchrun_compress.log";
    fs::path log1 = log;
    log1 += ".1.gz";
    fs::path log2 = log;
    log2 += ".2.gz";
    for (const auto& p : {log, log1, log2})
        FS_REMOVE(p);

    set_log_compression(true);
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();
    set_log_compression(false);
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));

    gzFile zf = gzopen(log1.c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[32];
    int n = gzread(zf, buf, sizeof(buf));
    gzclose(zf);
    REQUIRE(n > 0);

    for (const auto& p : {log, log1, log2})
        FS_REMOVE(p);
}

TEST_CASE("Logger switches between JSON and plain") {
    fs::path log = fs::temp_directory_path() / "watchrun_format.log";
    FS_REMOVE(log);
    init_logger(log.string());
    LoggerGuard guard;
    set_json_logging(true);
    log_info("json entry", {{"path", "src/a.cpp"}});
    flush_logger();
    set_json_logging(false);
    log_info("plain entry");
    flush_logger();
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].rfind("{", 0) == 0);
    REQUIRE(lines[0].find("\"path\":\"src/a.cpp\"") != std::string::npos);
    REQUIRE(lines[0].find("\"level\":\"INFO\"") != std::string::npos);
    REQUIRE(lines[1].rfind("[", 0) == 0);
    REQUIRE(lines[1].find("[INFO] plain entry") != std::string::npos);
    FS_REMOVE(log);
}

TEST_CASE("Logger filters by level") {
    fs::path log = fs::temp_directory_path() / "watchrun_level.log";
    FS_REMOVE(log);
    init_logger(log.string(), LogLevel::WARNING);
    LoggerGuard guard;
    log_debug("hidden debug");
    log_info("hidden info");
    log_warning("shown warning");
    log_error("shown error");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("[WARNING] shown warning") != std::string::npos);
    REQUIRE(lines[1].find("[ERROR] shown error") != std::string::npos);
    FS_REMOVE(log);
}

TEST_CASE("shutdown_logger drains queued messages") {
    fs::path log = fs::temp_directory_path() / "watchrun_drain.log";
    FS_REMOVE(log);
    init_logger(log.string());
    for (int i = 0; i < 50; ++i)
        log_info("queued " + std::to_string(i));
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 50);
    FS_REMOVE(log);
}

TEST_CASE("init_logger keeps the previous file when reopening fails") {
    fs::path log = fs::temp_directory_path() / "watchrun_fail_reinit.log";
    FS_REMOVE(log);
    init_logger(log.string());
    LoggerGuard guard;
    log_info("before");
    fs::path bad = log.parent_path() / "watchrun_missing_dir" / "logger.log";
    init_logger(bad.string());
    log_info("after");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1].find("after") != std::string::npos);
    FS_REMOVE(log);
}

TEST_CASE("Console sink labels lines by level") {
    CerrCapture capture;
    init_console_logger(false);
    LoggerGuard guard;
    set_log_level(LogLevel::DEBUG);
    log_info("File change detected! Restarting!");
    log_warning("slow");
    log_error("Command exited with code 2");
    log_debug("Settled change: modify: a");
    flush_logger();
    shutdown_logger();

    std::string out = capture.out.str();
    REQUIRE(out.find("Watcher File change detected! Restarting!\n") != std::string::npos);
    REQUIRE(out.find("warning: slow\n") != std::string::npos);
    REQUIRE(out.find("error: Command exited with code 2\n") != std::string::npos);
    REQUIRE(out.find("debug: Settled change: modify: a\n") != std::string::npos);
    REQUIRE(out.find("\033[") == std::string::npos);
}

TEST_CASE("Console sink colors labels by default") {
    CerrCapture capture;
    init_console_logger();
    LoggerGuard guard;
    log_info("Running make");
    shutdown_logger();
    REQUIRE(capture.out.str().find("\033[94mWatcher\033[0m Running make") != std::string::npos);
}

TEST_CASE("Console threshold only applies to the console") {
    fs::path log = fs::temp_directory_path() / "watchrun_console_level.log";
    FS_REMOVE(log);
    CerrCapture capture;
    init_console_logger(false, LogLevel::ERR);
    init_logger(log.string());
    LoggerGuard guard;
    log_info("file only");
    log_error("both");
    shutdown_logger();

    std::string out = capture.out.str();
    REQUIRE(out.find("file only") == std::string::npos);
    REQUIRE(out.find("error: both") != std::string::npos);
    REQUIRE(read_lines(log).size() == 2);
    FS_REMOVE(log);
}

#ifdef __linux__
TEST_CASE("init_syslog routes messages") {
    fs::path log = fs::temp_directory_path() / "watchrun_syslog.log";
    FS_REMOVE(log);
    g_syslog_messages.clear();
    init_logger(log.string());
    init_syslog(LOG_USER);
    LoggerGuard guard;
    log_info("syslog entry");
    shutdown_logger();
    REQUIRE_FALSE(g_syslog_messages.empty());
    REQUIRE(g_syslog_messages.back().find("syslog entry") != std::string::npos);
    FS_REMOVE(log);
}
#endif
