// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <istream>
#include <ostream>

#include "filectx/dispatcher.hpp"

namespace xpto::filectx {

// Serve requests read line by line from `in` until it reaches EOF, one at
// a time, writing each response to `out` before reading the next line.
// Lines that aren't valid JSON are logged and dropped without a response.
// Returns the number of responses written.
std::size_t serve(const dispatcher& disp, std::istream& in, std::ostream& out);

// Catch SIGINT and SIGTERM without restarting interrupted system calls, so
// a read blocked on stdin fails and `serve` returns.  A second signal gets
// the default action.
void install_stop_handlers();

// The signal caught by the stop handlers, or 0.
int stop_signal();

}  // namespace xpto::filectx
