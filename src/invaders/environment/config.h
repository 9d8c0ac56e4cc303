#pragma once
#include "invaders/environment/info.h"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace invaders::environment {

enum class ObservationType { kGrayscale, kRgb, kDownscaled, kRam };

// Side length of the square kDownscaled frame.
constexpr int kDownscaledSize = 84;
enum class ActionType { kDiscrete6, kDiscrete4, kMultiDiscrete };
enum class RewardType { kScoreDelta, kShaped, kTerminal, kCustom };

struct Config {
  ObservationType observation_type = ObservationType::kGrayscale;
  ActionType action_type = ActionType::kDiscrete6;
  RewardType reward_type = RewardType::kScoreDelta;
  // Required when reward_type is kCustom, ignored otherwise.
  RewardFunction reward_function;
  std::optional<size_t> max_episode_steps;
  size_t frame_skip = 1;
  size_t frame_stack = 1;
  float repeat_action_probability = 0.0f;
  uint64_t seed = 0;
};

ObservationType parse_observation_type(const std::string &name);
ActionType parse_action_type(const std::string &name);
RewardType parse_reward_type(const std::string &name);

// Throws ConfigurationError describing the first invalid field.
void validate(const Config &config);

Config load_config(const YAML::Node &node);
Config load_config(const std::filesystem::path &path);

// Shape of a single observation, including the frame-stack dimension when
// frame_stack > 1. The ram placeholder is never stacked.
std::vector<int64_t> observation_shape(const Config &config);

} // namespace invaders::environment
