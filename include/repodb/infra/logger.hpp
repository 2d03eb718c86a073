/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for RepoDB.
 *
 * @details
 * This header declares the `Logger` class, the centralized reporting interface
 * of the data-access layer. Every subsystem (remote client, cache, write queue,
 * CRUD façade) reports through it. Output is serialized by a single mutex so that
 * log lines emitted by concurrent lane workers never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace repodb::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Used to categorize the criticality of log entries, to route them to the
 * appropriate output stream, and to filter them against the configured threshold.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (e.g., per-attempt write tracing).
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events (e.g., collection initialised).
    WARN,  ///< Non-blocking anomalies (e.g., write conflict, retry scheduled).
    ERROR, ///< Recoverable runtime errors that do not halt the system.
    FATAL  ///< Critical system failures requiring immediate process termination.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * The Logger implements a thread-safe, static interface for writing diagnostic
 * artifacts. Messages below the process-wide threshold (`set_level`) are dropped
 * before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * repodb::infra::Logger::log(LogLevel::WARN, "Queue: Conflict on db/users.json, retrying");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be emitted.
     *
     * @param level Messages strictly below this level are discarded.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the currently configured minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a textual level ("trace", "debug", "info", "warn", "error", "fatal").
     *
     * @param name Case-insensitive level name.
     * @param fallback Returned when the name is not recognised.
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback);

  private:
    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Process-wide emission threshold.
    static std::atomic<LogLevel> threshold_;
};

} // namespace repodb::infra
