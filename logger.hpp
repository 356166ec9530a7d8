#pragma once
#include <string>
#include <chrono>

// =====================================================
// Build Mode Enum
// =====================================================
enum class BuildMode {
    Debug,
    Release
};

// Global build mode (auto-detect from compiler flags)
extern BuildMode g_buildMode;

// =====================================================
// Log levels (lowest first)
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Error,
    Off
};

// Lines below this level are dropped. Default: Trace in Debug builds,
// Debug in Release builds.
void setLogLevel(LogLevel level);
LogLevel logLevel();

// "trace" | "debug" | "info" | "error" | "off" (any case).
// Unknown names fall back to `fallback`.
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::Debug);

// =====================================================
// Phase Info Struct (startup/shutdown milestones)
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success;            // true = success, false = failure
};

// Most recent phase
extern PhaseInfo g_phaseInfo;

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename);
void shutdownLogger();

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logTrace(const std::string& tag, const std::string& msg);
void logDebug(const std::string& tag, const std::string& msg);
void logInfo(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
// TRACE/DEBUG skip building the message when the level is filtered out
#define LOG_TRACE(tag, msg) \
    do { if (logLevel() <= LogLevel::Trace) logTrace(tag, msg); } while (0)
#define LOG_DEBUG(tag, msg) \
    do { if (logLevel() <= LogLevel::Debug) logDebug(tag, msg); } while (0)
#define LOG_INFO(tag, msg) logInfo(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
