#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace invaders::emulator {

typedef std::vector<unsigned char> ScreenBuffer;

constexpr int kScreenWidth = 256;
constexpr int kScreenHeight = 224;
constexpr size_t kRamSize = 8192;

// Input port bits.
namespace buttons {
constexpr uint8_t kCoin = 1 << 0;
constexpr uint8_t kP2Start = 1 << 1;
constexpr uint8_t kP1Start = 1 << 2;
constexpr uint8_t kP1Fire = 1 << 4;
constexpr uint8_t kLeft = 1 << 5;
constexpr uint8_t kRight = 1 << 6;
} // namespace buttons

// Deterministic arcade hardware. Every call blocks until the hardware has
// finished the requested work.
class VirtualEmulator {
public:
  virtual ~VirtualEmulator() = default;

  virtual void reset() = 0;
  virtual void step_frame() = 0;
  virtual void set_input(uint8_t buttons) = 0;

  virtual uint32_t score() = 0;
  virtual int lives() = 0;
  virtual int level() = 0;
  virtual bool game_over() = 0;
  virtual uint32_t frame_count() = 0;

  // The blob at path is owned by the hardware and is never inspected.
  virtual void save_state(const std::filesystem::path &path) = 0;
  virtual void load_state(const std::filesystem::path &path) = 0;

  // Four bytes per pixel, row major, kScreenHeight rows of kScreenWidth.
  virtual void get_screen_argb(ScreenBuffer &buffer) = 0;
  // One byte per pixel, row major.
  virtual void get_screen_grayscale(ScreenBuffer &buffer) = 0;
};

} // namespace invaders::emulator
