#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>

namespace invaders::environment {

struct ResetInfo {
  uint32_t score;
  int lives;
  int level;
  uint32_t frame_count;
};

// Counters read once after the frame-skip window of a step.
struct Info {
  uint32_t score;
  uint32_t total_score;
  int64_t score_delta;
  int lives;
  int lives_lost;
  int level;
  uint32_t frame_count;
  size_t steps;
  bool terminated;
};

// Must be a pure function of the info record.
typedef std::function<float(const Info &)> RewardFunction;

} // namespace invaders::environment
