#pragma once

#include "vigil/cli/commands.hpp"
#include "vigil/config/system_config.hpp"
#include "vigil/core/error.hpp"

namespace vigil::cli {

// Config file (or defaults when none is given) with CLI overrides applied.
[[nodiscard]] auto load_config(const Overrides& overrides)
    -> Result<SystemConfig>;

}  // namespace vigil::cli
