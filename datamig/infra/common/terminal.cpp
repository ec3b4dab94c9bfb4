// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <cstdlib>
#include <string_view>

#include <unistd.h>

namespace datamig {

static bool is_terminal(int fd) {
    return isatty(fd) == 1;
}

bool is_terminal_stdout() {
    return is_terminal(STDOUT_FILENO);
}

bool is_terminal_stderr() {
    return is_terminal(STDERR_FILENO);
}

bool is_color_disabled_by_env() {
    // https://no-color.org
    const char* no_color{std::getenv("NO_COLOR")};
    if (no_color != nullptr && *no_color != '\0') {
        return true;
    }
    const char* term{std::getenv("TERM")};
    return term != nullptr && std::string_view{term} == "dumb";
}

}  // namespace datamig
