#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace liblowess {
namespace utils {

/**
 * @brief Level-filtered logging to stderr
 *
 * Control via environment variable: LIBLOWESS_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 * Default: warn in release builds (NDEBUG), info otherwise
 *
 * Example usage:
 *   LIBLOWESS_DEBUG("radius " << h << " at rank " << r);
 *   LIBLOWESS_TIMING_START();
 *   // ... do work ...
 *   LIBLOWESS_TIMING_END("Local fit");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads LIBLOWESS_LOG_LEVEL environment variable
	 */
	static void Initialize();

	/**
	 * @brief Set global log level
	 *
	 * @param level Minimum level to output
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name trace, debug, info, warn, error or none
	 * @param level Set on success
	 * @return false if the name is not recognized
	 */
	static bool ParseLevel(const std::string &name, LogLevel &level);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log duration at debug level
	 *
	 * @param handle Handle from TimingStart()
	 * @param operation_name Human-readable operation name
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel DefaultLevel();

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define LIBLOWESS_LOG_AT(level, msg)                                                                                   \
	do {                                                                                                               \
		if (liblowess::utils::Tracer::ShouldLog(level)) {                                                              \
			std::ostringstream liblowess_oss;                                                                          \
			liblowess_oss << msg;                                                                                      \
			liblowess::utils::Tracer::Log(level, __FILE__, __LINE__, liblowess_oss.str());                             \
		}                                                                                                              \
	} while (0)

/**
 * @brief Trace-level logging with stream syntax
 *
 * Usage: LIBLOWESS_TRACE(message << stream << contents)
 */
#define LIBLOWESS_TRACE(msg) LIBLOWESS_LOG_AT(liblowess::utils::LogLevel::TRACE, msg)

#define LIBLOWESS_DEBUG(msg) LIBLOWESS_LOG_AT(liblowess::utils::LogLevel::DBG, msg)

#define LIBLOWESS_INFO(msg) LIBLOWESS_LOG_AT(liblowess::utils::LogLevel::INFO, msg)

#define LIBLOWESS_WARN(msg) LIBLOWESS_LOG_AT(liblowess::utils::LogLevel::WARN, msg)

#define LIBLOWESS_ERROR(msg) LIBLOWESS_LOG_AT(liblowess::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   LIBLOWESS_TIMING_START();
 *   // ... do work ...
 *   LIBLOWESS_TIMING_END("Operation name");
 */
#define LIBLOWESS_TIMING_START() uint64_t liblowess_timing_handle = liblowess::utils::Tracer::TimingStart()

#define LIBLOWESS_TIMING_END(operation_name) liblowess::utils::Tracer::TimingEnd(liblowess_timing_handle, operation_name)

} // namespace utils
} // namespace liblowess
