/*
 * Logging subsystem implementation
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cerrno>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

#define G_LOG_DOMAIN "libnotify"
#include "libnotify/notify.h"

#include "launchconfig.hpp"
#include "log.hpp"
#include "util.hpp"

#include "fmt/format.h"
#include "fmt/printf.h"

static FILE *log_file = nullptr;
static Level current_log_level = Level::Warning;
static bool terminal_output = false;
static gboolean notify_initialized = FALSE;

/* Color codes for terminal output */
#define COLOR_RESET "\033[0m"
#define COLOR_SYSTEM "\033[36m"
#define COLOR_RED "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_GREEN "\033[32m"
#define COLOR_BLUE "\033[34m"

static constexpr const char *const level_strings[] = {"\0", "SYSTEM", "ERROR", "WARN", "INFO", "DEBUG"};
static constexpr const char *const level_colors[] = {"\0", COLOR_SYSTEM, COLOR_RED, COLOR_YELLOW, COLOR_GREEN, COLOR_BLUE};

static_assert(sizeof(level_strings) == sizeof(level_colors), "each log level string should have a corresponding color");

/* Parse log level from string */
static Level parse_log_level(const char *level_str) {
    if (!level_str || (strlen(level_str) > (sizeof("error") - 1UL))) /* longest level name */
        return Level::Warning;

    Level level = Level::Warning;
    if (LCSTRING_EQUALS(level_str, "none"))
        level = Level::None;
    else if (LCSTRING_EQUALS(level_str, "error"))
        level = Level::Error;
    else if (LCSTRING_EQUALS(level_str, "warn"))
        level = Level::Warning;
    else if (LCSTRING_EQUALS(level_str, "info"))
        level = Level::Info;
    else if (LCSTRING_EQUALS(level_str, "debug"))
        level = Level::Debug;

    return level;
}

static void format_now(char *buf, size_t size) {
    time_t now = time(nullptr);
    struct tm tm_info;
    localtime_r(&now, &tm_info);
    strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_info);
}

RESULT log_init(void) {
    std::string log_file_path;
    terminal_output = !!isatty(STDOUT_FILENO);

    /* localtime_r() is not required to call tzset(3) itself */
    tzset();

    const char *log_level_env = getenv("GAMELAUNCH_LOG_LEVEL");
    if (log_level_env)
        log_set_level(parse_log_level(log_level_env));

    notify_initialized = notify_init(PROG_NAME);

    if (current_log_level == Level::None)
        return MAKE_RESULT(SEV_SUCCESS, CAT_GENERAL, E_CANCELED);

    const char *log_file_env = getenv("GAMELAUNCH_LOG_FILE");
    if (log_file_env)
        log_file_path = log_file_env;
    else if (config::data_dir)
        log_file_path = join_path(config::data_dir, PROG_NAME ".log");

    if (log_file_path.empty())
        return MAKE_RESULT(SEV_WARNING, CAT_GENERAL, E_NOT_READY);

    log_file = fopen(log_file_path.c_str(), "a");
    if (!log_file) {
        /* Fall back to the terminal only */
        RESULT result = result_from_errno();
        fmt::fprintf(stderr, "Failed to open log file %s: %s\n", log_file_path, strerror(errno));
        return result;
    }

    char time_str[64];
    format_now(time_str, sizeof(time_str));
    fmt::fprintf(log_file, "=== Log session started at %s ===\n", time_str);
    fflush(log_file);

    return RESULT_OK;
}

void log_cleanup(void) {
    if (log_file) {
        char time_str[64];
        format_now(time_str, sizeof(time_str));

        fmt::fprintf(log_file, "=== Log session ended at %s ===\n\n", time_str);
        fflush(log_file);

        fclose(log_file);
        log_file = nullptr;
    }

    if (notify_initialized) {
        notify_uninit();
        notify_initialized = FALSE;
    }
}

void log_set_level(Level level) {
    if (level >= Level::None && level <= Level::Debug)
        current_log_level = level;
}

bool log_get_terminal_output(void) { return terminal_output; }

static void notify_system(const char *message) {
    NotifyNotification *notif = notify_notification_new(PROG_NAME, message, "dialog-information");

    notify_notification_set_urgency(notif, NOTIFY_URGENCY_CRITICAL);
    notify_notification_set_timeout(notif, 30000); /* 30 seconds */

    GError *error = nullptr;
    if (!notify_notification_show(notif, &error)) {
        if (log_file && error)
            fmt::fprintf(log_file, "[WARN] notification failed: %s\n", error->message);
    }
    if (error)
        g_error_free(error);

    g_object_unref(G_OBJECT(notif));
}

void _log_message(Level level, const char *file, int line, const char *format, ...) {
    if (level > current_log_level && level != Level::System)
        return;

    va_list args;

    if (level == Level::System && notify_initialized && !terminal_output) {
        char *message = nullptr;

        va_start(args, format);
        int len = vasprintf(&message, format, args);
        va_end(args);

        if (len >= 0) {
            notify_system(message);
            free(message);
        }
    }

    if (terminal_output) {
        FILE *output = (level <= Level::Warning) ? stderr : stdout;

        fmt::fprintf(output, "%s[%s]%s ", level_colors[static_cast<size_t>(level)],
                     level_strings[static_cast<size_t>(level)], COLOR_RESET);

        va_start(args, format);
        vfprintf(output, format, args);
        va_end(args);

        fmt::fprintf(output, "\n");
    }

    if (log_file) {
        char timestamp[32];
        format_now(timestamp, sizeof(timestamp));

        /* Get just the filename without the path */
        const char *filename = strrchr(file, '/');
        if (filename)
            filename++;
        else
            filename = file;

        fmt::fprintf(log_file, "[%s] %s %s:%d: ", level_strings[static_cast<size_t>(level)], timestamp, filename, line);

        va_start(args, format);
        vfprintf(log_file, format, args);
        va_end(args);

        fmt::fprintf(log_file, "\n");
        fflush(log_file);
    }
}

void _log_result(Level level, const char *file, int line, RESULT result, const char *context) {
    if (SUCCEEDED(result) && level < Level::Debug)
        return;
    if (level > current_log_level)
        return;

    const char *result_str = result_to_string(result);

    if (context && context[0] != '\0')
        _log_message(level, file, line, "%s: %s (0x%08X)", context, result_str, (unsigned)result);
    else
        _log_message(level, file, line, "Result: %s (0x%08X)", result_str, (unsigned)result);

    if (current_log_level == Level::Debug) {
        const int severity = RESULT_SEVERITY(result);
        const int category = RESULT_CATEGORY(result);
        const int code = RESULT_CODE(result);

        _log_message(Level::Debug, file, line, "  Details: Severity=%d, Category=%d, Code=0x%04X", severity, category,
                     code);
    }
}
