#include "invaders/emulator/space_invaders.h"
#include "invaders/errors.h"
#include <atomic>
#include <cstring>
#include <iostream>
#include <space_invaders_api.h>
#include <string>

namespace invaders::emulator {

namespace {

std::atomic<bool> hardware_in_use{false};

std::filesystem::path rom_file(const std::filesystem::path &directory,
                               const char *name) {
  auto path = directory / name;
  if (!std::filesystem::exists(path))
    throw EmulatorFailure("ROM file does not exist: " + path.string());
  return path;
}

} // namespace

SpaceInvadersEmulator::SpaceInvadersEmulator(const EmulatorConfig &config) {
  if (config.rom_directory.empty())
    throw ConfigurationError("ROM directory must not be empty.");
  const auto rom_h = rom_file(config.rom_directory, "invaders.h");
  const auto rom_g = rom_file(config.rom_directory, "invaders.g");
  const auto rom_f = rom_file(config.rom_directory, "invaders.f");
  const auto rom_e = rom_file(config.rom_directory, "invaders.e");

  if (hardware_in_use.exchange(true))
    throw EmulatorFailure("Another emulator instance is already running.");
  int result = si_api_init_headless(rom_h.c_str(), rom_g.c_str(),
                                    rom_f.c_str(), rom_e.c_str(),
                                    config.dip_switches.data());
  if (result != 0) {
    hardware_in_use = false;
    throw EmulatorFailure("Failed to initialize emulator (error code: " +
                          std::to_string(result) + ").");
  }
  std::cout << "Emulator initialized from " << config.rom_directory.string()
            << std::endl;
}

SpaceInvadersEmulator::~SpaceInvadersEmulator() {
  si_api_destroy();
  hardware_in_use = false;
  std::cout << "Emulator released" << std::endl;
}

void SpaceInvadersEmulator::reset() { si_api_reset(); }

void SpaceInvadersEmulator::step_frame() { si_api_step_frame(); }

void SpaceInvadersEmulator::set_input(uint8_t buttons) {
  si_api_set_input(buttons);
}

uint32_t SpaceInvadersEmulator::score() { return si_api_get_score(); }

int SpaceInvadersEmulator::lives() { return si_api_get_lives(); }

int SpaceInvadersEmulator::level() { return si_api_get_level(); }

bool SpaceInvadersEmulator::game_over() { return si_api_is_game_over(); }

uint32_t SpaceInvadersEmulator::frame_count() {
  return si_api_get_frame_count();
}

void SpaceInvadersEmulator::save_state(const std::filesystem::path &path) {
  if (si_api_save_state(path.c_str()) != 0)
    throw EmulatorFailure("Failed to save state to " + path.string());
  std::cout << "Saved emulator state to " << path.string() << std::endl;
}

void SpaceInvadersEmulator::load_state(const std::filesystem::path &path) {
  if (si_api_load_state(path.c_str()) != 0)
    throw EmulatorFailure("Failed to load state from " + path.string());
  std::cout << "Loaded emulator state from " << path.string() << std::endl;
}

void SpaceInvadersEmulator::get_screen_argb(ScreenBuffer &buffer) {
  si_api_update_framebuffer();
  const uint8_t *data = nullptr;
  int width = 0;
  int height = 0;
  si_api_get_framebuffer(&data, &width, &height);
  if (data == nullptr || width != kScreenWidth || height != kScreenHeight)
    throw EmulatorFailure("Unexpected framebuffer geometry.");
  buffer.resize(static_cast<size_t>(4 * width * height));
  std::memcpy(buffer.data(), data, buffer.size());
}

void SpaceInvadersEmulator::get_screen_grayscale(ScreenBuffer &buffer) {
  si_api_update_framebuffer();
  buffer.resize(static_cast<size_t>(kScreenWidth * kScreenHeight));
  si_api_get_framebuffer_gray(buffer.data());
}

} // namespace invaders::emulator
