#include "logger.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>
#include <vector>
#include <filesystem>
#include <chrono>
#include <algorithm>
#include <atomic>
#include <cctype>

// =====================================================
// Globals
// =====================================================
#if defined(_DEBUG) || !defined(NDEBUG)
BuildMode g_buildMode = BuildMode::Debug;
#else
BuildMode g_buildMode = BuildMode::Release;
#endif

PhaseInfo g_phaseInfo{};
static std::mutex g_logMutex;

static std::atomic<LogLevel> g_level{
    g_buildMode == BuildMode::Debug ? LogLevel::Trace : LogLevel::Debug
};

// Buffer for grouped phase logging
static bool g_buffering = false;
static std::vector<std::string> g_phaseBuffer;

// File output stream
static std::ofstream g_logFile;

// =====================================================
// Helpers
// =====================================================
static std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

static std::string nowTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

static std::string basename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

static void writeLine(const std::string& line) {
    if (g_logFile.is_open()) {
        g_logFile << line << '\n';
        g_logFile.flush();
    }
    std::cerr << line << std::endl;
}

static void writeTagged(LogLevel level, const char* label,
                        const std::string& tag, const std::string& msg) {
    if (level < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine("[" + nowTimestamp() + "][" + label + "][" + tag + "] " + msg);
}

// =====================================================
// Levels
// =====================================================
void setLogLevel(LogLevel level) {
    g_level.store(level);
}

LogLevel logLevel() {
    return g_level.load();
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return LogLevel::Trace;
    if (s == "debug") return LogLevel::Debug;
    if (s == "info")  return LogLevel::Info;
    if (s == "error") return LogLevel::Error;
    if (s == "off")   return LogLevel::Off;
    return fallback;
}

// =====================================================
// Buffering controls
// =====================================================
void beginPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_buffering = true;
    g_phaseBuffer.clear();
}

void endPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    for (auto& line : g_phaseBuffer) {
        writeLine(line);
    }
    g_phaseBuffer.clear();
    g_buffering = false;
}

// =====================================================
// Phase Logging
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    std::lock_guard<std::mutex> lock(g_logMutex);

    g_phaseInfo.timestamp = std::chrono::system_clock::now();
    g_phaseInfo.fileName  = basename(file);
    g_phaseInfo.phaseName = phase;
    g_phaseInfo.success   = success;

    // failed phases are always shown, successful ones follow the level
    if (success && g_level.load() > LogLevel::Info) return;

    std::ostringstream oss;
    oss << "| " << formatTimestamp(g_phaseInfo.timestamp)
        << " | " << g_phaseInfo.fileName
        << " | " << g_phaseInfo.phaseName
        << " | " << (g_phaseInfo.success ? "true" : "false")
        << " |";

    std::string entry = oss.str();

    if (g_buffering) {
        g_phaseBuffer.push_back(entry);
    } else {
        writeLine(entry);
    }
}

// =====================================================
// Trace / Debug / Info / Error Logging
// =====================================================
void logTrace(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Trace, "TRACE", tag, msg);
}

void logDebug(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Debug, "DEBUG", tag, msg);
}

void logInfo(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Info, "INFO", tag, msg);
}

void logError(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Error, "ERROR", tag, msg);
}

// =====================================================
// Lifecycle
// =====================================================
namespace fs = std::filesystem;

void initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    if (g_logFile.is_open()) {
        g_logFile.close();
    }

    fs::path logPath = fs::absolute(filename);
    g_logFile.open(logPath, std::ios::out | std::ios::app);

    if (g_logFile.is_open()) {
        g_logFile << "==== polltimer log started ====" << std::endl;
        writeLine("[" + nowTimestamp() + "][Logger] Writing logs to: " + logPath.string());
    } else {
        std::cerr << "[Logger] ERROR: Could not open log file: "
                  << logPath.string() << std::endl;
    }
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << "==== polltimer log ended ====" << std::endl;
        g_logFile.close();
    }
}
