/*
 * Common miscellaneous macros/routines
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdio>
#include <unistd.h>

#define forceinline __attribute__((always_inline)) inline

#ifndef ARRAY_SIZE
#define ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))
#endif

/* Cleanup function for FILE pointers */
static forceinline void cleanup_file(void *p) {
    FILE **fp = (FILE **)p;
    if (fp && *fp) {
        fclose(*fp);
        *fp = nullptr;
    }
}

/* Cleanup function for file descriptors */
static forceinline void cleanup_fd(void *p) {
    int *fd = (int *)p;
    if (fd && *fd >= 0) {
        close(*fd);
        *fd = -1;
    }
}

#define autoclose [[gnu::cleanup(cleanup_file)]]
#define autoclose_fd [[gnu::cleanup(cleanup_fd)]]
