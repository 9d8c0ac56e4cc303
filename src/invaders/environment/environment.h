#pragma once
#include "invaders/emulator/emulator.h"
#include "invaders/environment/action.h"
#include "invaders/environment/config.h"
#include "invaders/environment/info.h"
#include "invaders/environment/observation.h"
#include "invaders/environment/reward.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <random>
#include <torch/torch.h>

namespace invaders::environment {

enum class Phase { kReady, kEpisodeActive, kEpisodeDone };

struct ResetOptions {
  // Load this save state instead of cold resetting the hardware.
  std::optional<std::filesystem::path> state_file;
};

struct Reset {
  torch::Tensor observation;
  ResetInfo info;
};

struct Step {
  torch::Tensor observation;
  float reward;
  bool terminated;
  bool truncated;
  Info info;
};

struct EpisodeState {
  size_t steps = 0;
  uint32_t episode_score = 0;
  uint32_t prev_score = 0;
  int prev_lives = 0;
  Action last_action = int64_t{0};
};

// Owns one emulator for its whole lifetime. Not reentrant: reset and step
// must not overlap.
class Environment {
public:
  Environment(std::unique_ptr<emulator::VirtualEmulator> emulator,
              Config config);

  Reset reset(std::optional<uint64_t> seed = std::nullopt,
              const ResetOptions &options = {});
  // Throws StaleEpisodeError unless an episode is active.
  Step step(const Action &action);

  void save_state(const std::filesystem::path &path);
  void load_state(const std::filesystem::path &path);

  Phase phase() const { return phase_; }
  const EpisodeState &episode() const { return episode_; }
  const Config &config() const { return config_; }
  const ActionEncoder &action_encoder() const { return action_encoder_; }
  std::vector<int64_t> observation_shape() const;

private:
  void bring_up();
  void hold_input(uint8_t buttons);

  std::unique_ptr<emulator::VirtualEmulator> emulator_;
  const Config config_;
  const ActionEncoder action_encoder_;
  std::unique_ptr<RewardPolicy> reward_policy_;
  ObservationComposer observation_composer_;
  std::mt19937_64 random_generator_;
  std::uniform_real_distribution<double> distribution_;
  EpisodeState episode_;
  Phase phase_;
};

} // namespace invaders::environment
