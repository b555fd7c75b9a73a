/*
 * Shared helper functions
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include <wordexp.h>

#include <glib.h>

#include "log.hpp"
#include "macros.hpp"
#include "util.hpp"

#include "fmt/format.h"

RESULT ensure_dir(const char *path) {
    if (!path || !path[0])
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_INVALID_ARG);

    std::string partial;
    partial.reserve(strlen(path));

    /* mkdir -p: create every missing component in turn */
    for (const char *p = path; *p; p++) {
        partial.push_back(*p);
        if (p[1] != '/' && p[1] != '\0')
            continue;
        if (partial == "/")
            continue;
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            RESULT result = result_from_errno();
            LOG_DEBUG("mkdir(%s) failed: %s", partial.c_str(), strerror(errno));
            return result;
        }
    }

    if (!is_directory(path))
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_NOT_DIR);

    if (access(path, W_OK) != 0)
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_ACCESS_DENIED);

    return RESULT_OK;
}

std::string expand_path(const char *path) {
    wordexp_t p;
    std::string result;

    if (!path)
        return result;

    if (wordexp(path, &p, WRDE_NOCMD) != 0)
        return result;

    if (p.we_wordc > 0)
        result = p.we_wordv[0];

    wordfree(&p);
    return result;
}

std::string join_path(std::string_view base, std::string_view rel) {
    if (rel.empty())
        return std::string(base);
    if (base.empty() || rel.front() == '/')
        return std::string(rel);
    if (base.back() == '/')
        return fmt::format("{}{}", base, rel);
    return fmt::format("{}/{}", base, rel);
}

RESULT split_shell_words(std::string_view line, std::vector<std::string> *words) {
    std::string text(line);
    gchar **argv = nullptr;
    GError *error = nullptr;

    words->clear();

    if (!g_shell_parse_argv(text.c_str(), nullptr, &argv, &error)) {
        /* blank or comment-only input is no words, not an error */
        const bool empty = g_error_matches(error, G_SHELL_ERROR, G_SHELL_ERROR_EMPTY_STRING);
        if (!empty)
            LOG_DEBUG("Could not split \"%s\": %s", text.c_str(), error->message);
        g_error_free(error);
        return empty ? RESULT_OK : MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_PARSE_ERROR);
    }

    for (gchar **arg = argv; *arg; arg++)
        words->emplace_back(*arg);
    g_strfreev(argv);

    return RESULT_OK;
}

std::string shell_quote(std::string_view word) {
    if (word.empty())
        return "''";

    if (word.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-./=:,+%@") ==
        std::string_view::npos)
        return std::string(word);

    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

RESULT read_file(const char *path, std::string *contents) {
    autoclose FILE *fp = fopen(path, "rb");
    char buffer[BUFFER_SIZE];
    size_t n;

    if (!fp)
        return result_from_errno();

    contents->clear();
    while ((n = fread(buffer, 1, sizeof(buffer), fp)) > 0)
        contents->append(buffer, n);

    if (ferror(fp))
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_IO_ERROR);

    return RESULT_OK;
}

RESULT write_file_replace(const char *path, std::string_view contents) {
    std::string temp_path = fmt::format("{}.tmp", path);

    {
        autoclose FILE *fp = fopen(temp_path.c_str(), "wb");
        if (!fp)
            return result_from_errno();

        if (fwrite(contents.data(), 1, contents.size(), fp) != contents.size() || fflush(fp) != 0) {
            RESULT result = result_from_errno();
            unlink(temp_path.c_str());
            return FAILED(result) ? result : MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_IO_ERROR);
        }
    }

    if (rename(temp_path.c_str(), path) != 0) {
        RESULT result = result_from_errno();
        unlink(temp_path.c_str());
        return result;
    }

    return RESULT_OK;
}
