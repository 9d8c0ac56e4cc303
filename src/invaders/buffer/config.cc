#include "invaders/buffer/config.h"
#include "invaders/errors.h"
#include <string>

namespace invaders::buffer {

void validate(const ReplayConfig &config) {
  if (config.capacity == 0)
    throw ConfigurationError("capacity must be greater than 0.");
  if (!(config.alpha >= 0.0f))
    throw ConfigurationError("alpha must be non-negative.");
  if (!(config.beta >= 0.0f && config.beta <= 1.0f))
    throw ConfigurationError("beta must be within [0, 1].");
  if (!(config.beta_increment >= 0.0f))
    throw ConfigurationError("beta_increment must be non-negative.");
  if (!(config.epsilon > 0.0f))
    throw ConfigurationError("epsilon must be positive.");
  if (config.n_step == 0)
    throw ConfigurationError("n_step must be greater than 0.");
  if (!(config.gamma >= 0.0f && config.gamma <= 1.0f))
    throw ConfigurationError("gamma must be within [0, 1].");
}

ReplayConfig load_replay_config(const YAML::Node &node) {
  ReplayConfig config;
  long capacity = node["capacity"].as<long>(50000);
  long n_step = node["n_step"].as<long>(3);
  if (capacity < 1)
    throw ConfigurationError("capacity must be greater than 0, got " +
                             std::to_string(capacity) + ".");
  if (n_step < 1)
    throw ConfigurationError("n_step must be greater than 0, got " +
                             std::to_string(n_step) + ".");
  config.capacity = static_cast<size_t>(capacity);
  config.n_step = static_cast<size_t>(n_step);
  config.alpha = node["alpha"].as<float>(0.6f);
  config.beta = node["beta"].as<float>(0.4f);
  config.beta_increment = node["beta_increment"].as<float>(0.001f);
  config.epsilon = node["epsilon"].as<float>(1e-6f);
  config.gamma = node["gamma"].as<float>(0.99f);
  config.seed = node["seed"].as<uint64_t>(0);
  validate(config);
  return config;
}

} // namespace invaders::buffer
