#include "app.hpp"
#include "config.hpp"
#include "log.hpp"
#include "ncurses_terminal.hpp"
#include "terminal.hpp"
#include <cstdio>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
  std::error_code ec;
  std::filesystem::path start = std::filesystem::current_path(ec);
  if (argc >= 2) start = std::filesystem::path(argv[1]);

  init_logging(log_path());
  spdlog::info("panefm starting in {}", start.string());

  Options opts = default_options();
  try {
    Terminal term;
    NcursesTerminal nt;
    App app(nt, opts, start);
    if (auto rc = rc_path(); rc && std::filesystem::exists(*rc, ec)) app.load_rc(*rc);
    app.run();
  } catch (const std::runtime_error& e) {
    spdlog::critical("{}", e.what());
    std::fprintf(stderr, "panefm: %s\n", e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::critical("unexpected error: {}", e.what());
    std::fprintf(stderr, "panefm: unexpected error: %s\n", e.what());
    return 1;
  }
  spdlog::info("panefm exiting");
  return 0;
}
