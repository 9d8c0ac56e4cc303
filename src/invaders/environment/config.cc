#include "invaders/environment/config.h"
#include "invaders/emulator/emulator.h"
#include "invaders/errors.h"
#include <cmath>

namespace invaders::environment {

ObservationType parse_observation_type(const std::string &name) {
  if (name == "grayscale")
    return ObservationType::kGrayscale;
  if (name == "rgb")
    return ObservationType::kRgb;
  if (name == "downscaled")
    return ObservationType::kDownscaled;
  if (name == "ram")
    return ObservationType::kRam;
  throw ConfigurationError("Invalid obs_type: " + name +
                           ". Must be one of grayscale, rgb, downscaled, ram.");
}

ActionType parse_action_type(const std::string &name) {
  if (name == "discrete6")
    return ActionType::kDiscrete6;
  if (name == "discrete4")
    return ActionType::kDiscrete4;
  if (name == "multi_discrete")
    return ActionType::kMultiDiscrete;
  throw ConfigurationError(
      "Invalid action_type: " + name +
      ". Must be one of discrete6, discrete4, multi_discrete.");
}

RewardType parse_reward_type(const std::string &name) {
  if (name == "score_delta")
    return RewardType::kScoreDelta;
  if (name == "shaped")
    return RewardType::kShaped;
  if (name == "terminal")
    return RewardType::kTerminal;
  if (name == "custom")
    return RewardType::kCustom;
  throw ConfigurationError(
      "Invalid reward_type: " + name +
      ". Must be one of score_delta, shaped, terminal, custom.");
}

void validate(const Config &config) {
  if (config.reward_type == RewardType::kCustom && !config.reward_function)
    throw ConfigurationError(
        "reward_function must be provided when reward_type is custom.");
  if (config.frame_skip < 1)
    throw ConfigurationError("frame_skip must be >= 1.");
  if (config.frame_stack < 1)
    throw ConfigurationError("frame_stack must be >= 1.");
  if (std::isnan(config.repeat_action_probability) ||
      config.repeat_action_probability < 0.0f ||
      config.repeat_action_probability > 1.0f)
    throw ConfigurationError(
        "repeat_action_probability must be within [0, 1].");
  if (config.max_episode_steps && *config.max_episode_steps == 0)
    throw ConfigurationError("max_episode_steps must be positive.");
}

namespace {

size_t positive_count(const YAML::Node &node, const char *key,
                      long default_value) {
  long value = node[key].as<long>(default_value);
  if (value < 1)
    throw ConfigurationError(std::string(key) + " must be >= 1, got " +
                             std::to_string(value) + ".");
  return static_cast<size_t>(value);
}

} // namespace

Config load_config(const YAML::Node &node) {
  Config config;
  config.observation_type =
      parse_observation_type(node["obs_type"].as<std::string>("grayscale"));
  config.action_type =
      parse_action_type(node["action_type"].as<std::string>("discrete6"));
  config.reward_type =
      parse_reward_type(node["reward_type"].as<std::string>("score_delta"));
  if (node["max_episode_steps"] && !node["max_episode_steps"].IsNull())
    config.max_episode_steps = positive_count(node, "max_episode_steps", 1);
  config.frame_skip = positive_count(node, "frame_skip", 1);
  config.frame_stack = positive_count(node, "frame_stack", 1);
  config.repeat_action_probability =
      node["repeat_action_probability"].as<float>(0.0f);
  config.seed = node["seed"].as<uint64_t>(0);
  // A custom reward function cannot come from YAML, so it is validated when
  // the environment is constructed.
  if (config.reward_type != RewardType::kCustom)
    validate(config);
  return config;
}

Config load_config(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path))
    throw std::invalid_argument("Config file does not exist: " +
                                path.string());
  return load_config(YAML::LoadFile(path.string()));
}

std::vector<int64_t> observation_shape(const Config &config) {
  if (config.observation_type == ObservationType::kRam)
    return {static_cast<int64_t>(emulator::kRamSize)};
  std::vector<int64_t> shape;
  if (config.frame_stack > 1)
    shape.push_back(static_cast<int64_t>(config.frame_stack));
  switch (config.observation_type) {
  case ObservationType::kGrayscale:
    shape.insert(shape.end(), {emulator::kScreenHeight, emulator::kScreenWidth});
    break;
  case ObservationType::kRgb:
    shape.insert(shape.end(),
                 {emulator::kScreenHeight, emulator::kScreenWidth, 3});
    break;
  case ObservationType::kDownscaled:
    shape.insert(shape.end(), {kDownscaledSize, kDownscaledSize});
    break;
  case ObservationType::kRam:
    break;
  }
  return shape;
}

} // namespace invaders::environment
