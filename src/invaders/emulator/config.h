#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace invaders::emulator {

struct EmulatorConfig {
  // Directory holding invaders.h, invaders.g, invaders.f and invaders.e.
  std::filesystem::path rom_directory;
  std::array<uint8_t, 3> dip_switches = {0x0E, 0x08, 0x00};
};

EmulatorConfig load_emulator_config(const YAML::Node &node);

} // namespace invaders::emulator
