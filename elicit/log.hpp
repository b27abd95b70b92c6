#pragma once
#include <sstream>
#include <string>

/** \file elicit/log.hpp runtime logging
 *
 * Messages are filtered at runtime by a minimum level (`warning` by default, so `debug` messages
 * such as the MAP search trace cost only the level check).  Messages are written, prefixed with
 * the date/time and level, to stderr and, if a log file has been opened with elicit::log::open(),
 * to that file as well.
 *
 * Typical use:
 *
 *     ELICIT_LOG(info, "Generated " << profiles.size() << " candidate profiles");
 */

namespace elicit {
/// Namespace for runtime logging
namespace log {

/// Message severity levels, in increasing order of severity.
enum class level { debug = 0, info = 1, warning = 2, error = 3 };

/// Returns the upper-case name of the given level ("DEBUG", "INFO", "WARNING", "ERROR").
const char* to_string(level l);

/** Parses a level name (case-insensitive: "debug", "info", "warning", or "error").
 *
 * \throws std::invalid_argument if the name is not a valid level name
 */
level parse_level(const std::string &name);

/** Sets the minimum level of messages that are written.  The default is `level::warning`. */
void threshold(level min_level);

/// Returns the current minimum message level.
level threshold();

/// Returns true if messages of the given level will be written.
bool enabled(level l);

/** Opens (appending to) the given file as an additional log destination.  If a log file is
 * already open it is closed first.
 *
 * \throws std::runtime_error if the file cannot be opened for writing
 */
void open(const std::string &path);

/// Closes the log file, if one is open.  Messages continue to be written to stderr.
void close();

/// Writes a message of the given level, without checking the threshold.
void write(level l, const std::string &message);

}}

/** Logging macro.  ELICIT_LOG(info, a << b << c) formats `a << b << c` and writes it as an info
 * message if info messages are enabled; the stream expression is not evaluated otherwise.
 */
#define ELICIT_LOG(lvl, stuff) do { if (elicit::log::enabled(elicit::log::level::lvl)) { \
    std::ostringstream _elicit_log_s; _elicit_log_s << stuff; \
    elicit::log::write(elicit::log::level::lvl, _elicit_log_s.str()); } } while (0)
