#pragma once
/*
 * Logging
 *
 * Purpose: install the default spdlog logger before the UI takes the terminal.
 * Note: stderr belongs to the terminal while the UI runs, so without a log
 *       file everything goes to a null sink.
 */
#include <optional>
#include <string>

// $PANEFM_LOG, if set and non-empty
std::optional<std::string> log_path();

void init_logging(const std::optional<std::string>& path);
