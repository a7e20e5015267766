// SPDX-License-Identifier: MIT
#include "filectx/stdio.hpp"

#include <signal.h>

#include <boost/json.hpp>
#include <csignal>

#include "filectx/jsonrpc.hpp"
#include "logger.hpp"

namespace json = boost::json;

namespace xpto::filectx {

namespace {

volatile std::sig_atomic_t caught_signal{0};  // NOLINT

void on_stop_signal(int sig) { caught_signal = sig; }

}  // namespace

void install_stop_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESETHAND;  // no SA_RESTART
  for (int sig : {SIGINT, SIGTERM}) {
    if (::sigaction(sig, &sa, nullptr) != 0)
      LOG_WARN("Can't install handler for signal {}", sig);
  }
}

int stop_signal() { return caught_signal; }

/// Server loop

std::size_t serve(const dispatcher& disp, std::istream& in, std::ostream& out) {
  std::size_t responses{0};

  while (auto line = read_jsonrpc_line(in)) {
    json::error_code jec{};
    json::value request = json::parse(*line, jec);
    if (jec) {
      LOG_ERROR("Invalid JSON received: {}", jec.message());
      continue;
    }

    write_jsonrpc_line(out, disp.dispatch(request));
    if (!out) {
      LOG_ERROR("Output stream failed, stopping");
      break;
    }
    ++responses;
  }

  LOG_INFO("stdio session ended");
  return responses;
}

}  // namespace xpto::filectx
