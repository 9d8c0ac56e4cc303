#pragma once
#include <cstddef>
#include <cstdint>
#include <yaml-cpp/yaml.h>

namespace invaders::buffer {

struct ReplayConfig {
  size_t capacity = 50000;
  // Priority exponent, 0 samples uniformly.
  float alpha = 0.6f;
  // Initial importance sampling exponent, annealed towards 1.
  float beta = 0.4f;
  float beta_increment = 0.001f;
  // Floor added to every absolute TD error.
  float epsilon = 1e-6f;
  size_t n_step = 3;
  float gamma = 0.99f;
  uint64_t seed = 0;
};

void validate(const ReplayConfig &config);
ReplayConfig load_replay_config(const YAML::Node &node);

} // namespace invaders::buffer
