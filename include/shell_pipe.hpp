/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "config.hpp"
#include "file_descriptor.hpp"

// Runs an external program with stdout and stderr captured on one pipe.
// The child inherits no stdin. An unreaped child is terminated on destruction.
class ShellPipe {
    FileDescriptor read_fd_;
    pid_t pid_ = -1;
    std::optional<int> exit_status_;

   public:
    explicit ShellPipe(const std::vector<std::string>& args);

    ~ShellPipe();

    ShellPipe(const ShellPipe&) = delete;
    ShellPipe& operator=(const ShellPipe&) = delete;

    // Drains the pipe until EOF. Output past `max_bytes` is read and discarded
    // so the child never blocks on a full pipe.
    std::string read_all(std::size_t max_bytes = Config::SCANNER_OUTPUT_LIMIT);

    // Reaps the child. Returns its exit code, or 128 + signal number when it was killed.
    int wait();
};
