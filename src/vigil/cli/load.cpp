#include "load.hpp"

#include "vigil/config/config.hpp"

namespace vigil::cli {

auto load_config(const Overrides& overrides) -> Result<SystemConfig> {
  SystemConfig config;
  if (!overrides.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(overrides.config_file);
    if (!loaded) {
      return fail(loaded.error());
    }
    config = std::move(*loaded);
  }
  if (overrides.db_file) {
    config.storage.db_file = *overrides.db_file;
  }
  if (overrides.host) {
    config.api.host = *overrides.host;
  }
  if (overrides.port) {
    config.api.port = *overrides.port;
  }
  return config;
}

}  // namespace vigil::cli
