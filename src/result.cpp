/*
 * Error handling subsystem implementation
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cerrno>

#include "result.hpp"

RESULT result_from_errno(void) {
    int code;

    switch (errno) {
    case 0:
        return RESULT_OK;
    case ENOENT:
        code = E_FILE_NOT_FOUND;
        break;
    case EACCES:
    case EPERM:
        code = E_ACCESS_DENIED;
        break;
    case EEXIST:
        code = E_ALREADY_EXISTS;
        break;
    case ENOMEM:
        code = E_OUT_OF_MEMORY;
        break;
    case EINVAL:
        code = E_INVALID_ARG;
        break;
    case ENOTDIR:
        code = E_NOT_DIR;
        break;
    case EBUSY:
        code = E_BUSY;
        break;
    case ETIMEDOUT:
        code = E_TIMEOUT;
        break;
    case EOVERFLOW:
    case ERANGE:
        code = E_OVERFLOW;
        break;
    case ENOSYS:
    case ENOTSUP:
        code = E_NOT_SUPPORTED;
        break;
    default:
        code = E_IO_ERROR;
        break;
    }

    return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, code);
}

const char *result_to_string(RESULT result) {
    if (SUCCEEDED(result))
        return "Success";

    switch (RESULT_CODE(result)) {
    case E_UNKNOWN:
        return "Unknown error";
    case E_INVALID_ARG:
        return "Invalid argument";
    case E_OUT_OF_MEMORY:
        return "Out of memory";
    case E_FILE_NOT_FOUND:
        return "File not found";
    case E_ACCESS_DENIED:
        return "Access denied";
    case E_ALREADY_EXISTS:
        return "Already exists";
    case E_NOT_SUPPORTED:
        return "Not supported";
    case E_IO_ERROR:
        return "I/O error";
    case E_TIMEOUT:
        return "Timed out";
    case E_NOT_READY:
        return "Not ready";
    case E_NOT_FOUND:
        return "Not found";
    case E_CANCELED:
        return "Canceled";
    case E_BUSY:
        return "Resource busy";
    case E_PARSE_ERROR:
        return "Parse error";
    case E_NOT_DIR:
        return "Not a directory";
    case E_MISSING_NAME:
        return "Game missing name";
    case E_MISSING_COMMAND:
        return "Game missing command";
    case E_NO_SUCH_DIR_PREFIX:
        return "Nonexistent directory prefix";
    case E_UNRECOGNIZED_OPTION:
        return "Unrecognized option";
    case E_CONFLICTING_COMMAND:
        return "More than one command option";
    case E_GAME_NOT_TABLE:
        return "Game entry is not a table";
    case E_MISSING_GAMES:
        return "Missing games table";
    case E_NOT_INSTALLED:
        return "Game is not installed";
    case E_COMMAND_FAILED:
        return "Command failed";
    case E_EXEC_FAILED:
        return "Could not execute game";
    case E_NO_SUCH_GAME:
        return "No such game";
    case E_NO_GAME_ID:
        return "A game ID is required";
    case E_NO_EDITOR:
        return "No default editor in $EDITOR";
    case E_OVERFLOW:
        return "Value out of range";
    default:
        return "Unrecognized error code";
    }
}
