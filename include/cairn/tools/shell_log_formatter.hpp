#pragma once

#include "cairn/shell/shell_engine.hpp"

#include <string>

namespace cairn::tools {

// One JSON object per command, without a trailing newline.
[[nodiscard]] std::string format_shell_command_log_json(const cairn::shell::CommandMetrics& metrics);

}  // namespace cairn::tools
