#pragma once
#include "invaders/emulator/config.h"
#include "invaders/emulator/emulator.h"
#include <filesystem>

namespace invaders::emulator {

// Headless Space Invaders hardware. The underlying library keeps its state in
// process globals, so at most one instance may be alive at a time.
class SpaceInvadersEmulator : public VirtualEmulator {
public:
  explicit SpaceInvadersEmulator(const EmulatorConfig &config);
  ~SpaceInvadersEmulator() override;

  SpaceInvadersEmulator(const SpaceInvadersEmulator &) = delete;
  SpaceInvadersEmulator &operator=(const SpaceInvadersEmulator &) = delete;

  void reset() override;
  void step_frame() override;
  void set_input(uint8_t buttons) override;

  uint32_t score() override;
  int lives() override;
  int level() override;
  bool game_over() override;
  uint32_t frame_count() override;

  void save_state(const std::filesystem::path &path) override;
  void load_state(const std::filesystem::path &path) override;

  void get_screen_argb(ScreenBuffer &buffer) override;
  void get_screen_grayscale(ScreenBuffer &buffer) override;
};

} // namespace invaders::emulator
