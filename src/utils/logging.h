/**
 * @file logging.h
 * @brief Runtime verbose flag and message format for ferry tools.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>
#include <QtGlobal>

namespace ferry {

/// Enables LOG_VERBOSE() output; set from --verbose by the command-line tool
inline bool verboseLogging = false;

/**
 * @brief Applies the logging setup of the command-line tool.
 * @param verbose Turns on LOG_VERBOSE() output and timestamps every line.
 *
 * Unless QT_MESSAGE_PATTERN is set in the environment, messages are
 * prefixed with their severity; verbose mode adds a millisecond timestamp
 * so transfer timing can be read from the log.
 */
inline void configureLogging(bool verbose)
{
    verboseLogging = verbose;
    if (qEnvironmentVariableIsSet("QT_MESSAGE_PATTERN")) {
        return;
    }
    qSetMessagePattern(verbose
        ? QStringLiteral("%{time hh:mm:ss.zzz} [%{type}] %{message}")
        : QStringLiteral("[%{type}] %{message}"));
}

} // namespace ferry

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (ferry::verboseLogging) qDebug()

#endif // LOGGING_H
