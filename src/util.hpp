/*
 * Shared header for helper functions
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <string>
#include <string_view>
#include <strings.h>
#include <cstring>
#include <sys/stat.h>
#include <vector>

#include "result.hpp"

#define BUFFER_SIZE 8192

/* case sensitive */
#define STRING_EQUALS(string1, string2) (strcmp(string1, string2) == 0)
/* lowercase string equals (case insensitive) */
#define LCSTRING_EQUALS(string1, string2) (strcasecmp(string1, string2) == 0)

/* Ensure a directory exists and is writable, creating it if necessary
 * Will create parent directories as needed (like mkdir -p)
 * Returns RESULT_OK on success, error RESULT on failure */
RESULT ensure_dir(const char *path);

/* Expands shell paths like ~ to their full equivalents (using wordexp)
 * Returns an empty string on failure */
std::string expand_path(const char *path);

/* Join two path components with a single `/`. An absolute `rel` replaces `base`,
 * empty components are skipped. */
std::string join_path(std::string_view base, std::string_view rel);

/* Split a command line into words with g_shell_parse_argv() (quotes and backslashes, no expansion)
 * Returns E_PARSE_ERROR on an unterminated quote */
RESULT split_shell_words(std::string_view line, std::vector<std::string> *words);

/* Quote a single word so a shell would read it back unchanged */
std::string shell_quote(std::string_view word);

/* Read a whole file into `contents`
 * Returns E_FILE_NOT_FOUND (CAT_SYSTEM) if it does not exist */
RESULT read_file(const char *path, std::string *contents);

/* Replace `path` with `contents` by writing a sibling temporary file and renaming it */
RESULT write_file_replace(const char *path, std::string_view contents);

static inline bool is_directory(const char *path) {
    struct stat st;
    return stat(path, &st) == 0 && S_ISDIR(st.st_mode);
}
