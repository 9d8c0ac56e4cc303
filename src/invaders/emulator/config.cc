#include "invaders/emulator/config.h"
#include "invaders/errors.h"
#include <string>

namespace invaders::emulator {

EmulatorConfig load_emulator_config(const YAML::Node &node) {
  EmulatorConfig config;
  config.rom_directory = node["rom_directory"].as<std::string>("");
  if (const auto &dips = node["dip_switches"]) {
    if (!dips.IsSequence() || dips.size() != config.dip_switches.size())
      throw ConfigurationError("dip_switches must list exactly 3 values.");
    for (size_t i = 0; i < config.dip_switches.size(); ++i) {
      auto value = dips[i].as<int>();
      if (value < 0 || value > 0xFF)
        throw ConfigurationError("dip_switches values must fit in a byte.");
      config.dip_switches[i] = static_cast<uint8_t>(value);
    }
  }
  return config;
}

} // namespace invaders::emulator
