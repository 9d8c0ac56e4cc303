#include "invaders/environment/environment.h"
#include "invaders/errors.h"

namespace invaders::environment {

Environment::Environment(std::unique_ptr<emulator::VirtualEmulator> emulator,
                         Config config)
    : emulator_(std::move(emulator)), config_([&] {
        validate(config);
        return std::move(config);
      }()),
      action_encoder_(config_.action_type),
      reward_policy_(make_reward_policy(config_.reward_type,
                                        config_.reward_function)),
      observation_composer_(config_.observation_type, config_.frame_stack),
      random_generator_(config_.seed), distribution_(0.0, 1.0),
      phase_(Phase::kReady) {
  if (!emulator_)
    throw std::invalid_argument("Emulator must not be null.");
  episode_.last_action = action_encoder_.noop();
}

Reset Environment::reset(std::optional<uint64_t> seed,
                         const ResetOptions &options) {
  if (seed)
    random_generator_.seed(*seed);

  if (options.state_file)
    emulator_->load_state(*options.state_file);
  else
    bring_up();

  episode_ = EpisodeState{};
  episode_.prev_lives = emulator_->lives();
  episode_.last_action = action_encoder_.noop();
  observation_composer_.clear();
  phase_ = Phase::kEpisodeActive;

  return {.observation = observation_composer_.compose(*emulator_),
          .info = {.score = 0,
                   .lives = episode_.prev_lives,
                   .level = 1,
                   .frame_count = emulator_->frame_count()}};
}

Step Environment::step(const Action &action) {
  if (phase_ == Phase::kReady)
    throw StaleEpisodeError("Cannot step before the first reset.");
  if (phase_ == Phase::kEpisodeDone)
    throw StaleEpisodeError(
        "Cannot step in an episode that is over, call reset first.");

  // Out of range actions are rejected even when they would be replaced.
  uint8_t buttons = action_encoder_.encode(action);
  const bool repeated =
      config_.repeat_action_probability > 0.0f &&
      distribution_(random_generator_) < config_.repeat_action_probability;
  if (repeated)
    buttons = action_encoder_.encode(episode_.last_action);

  for (size_t i = 0; i < config_.frame_skip; ++i)
    hold_input(buttons);

  const uint32_t score = emulator_->score();
  const int lives = emulator_->lives();
  const bool game_over = emulator_->game_over();
  const int level = emulator_->level();

  Info info{.score = score,
            .total_score = score,
            .score_delta = static_cast<int64_t>(score) -
                           static_cast<int64_t>(episode_.prev_score),
            .lives = lives,
            .lives_lost = episode_.prev_lives - lives,
            .level = level,
            .frame_count = emulator_->frame_count(),
            .steps = episode_.steps + 1,
            .terminated = game_over};
  // A throwing reward function leaves the episode state as it was.
  float reward = (*reward_policy_)(info);

  if (!repeated)
    episode_.last_action = action;
  episode_.prev_score = score;
  episode_.prev_lives = lives;
  episode_.episode_score = score;
  episode_.steps = info.steps;
  auto observation = observation_composer_.compose(*emulator_);

  bool truncated = config_.max_episode_steps.has_value() &&
                   episode_.steps >= *config_.max_episode_steps;
  if (game_over || truncated)
    phase_ = Phase::kEpisodeDone;

  return {.observation = std::move(observation),
          .reward = reward,
          .terminated = game_over,
          .truncated = truncated,
          .info = info};
}

void Environment::save_state(const std::filesystem::path &path) {
  emulator_->save_state(path);
}

void Environment::load_state(const std::filesystem::path &path) {
  emulator_->load_state(path);
}

std::vector<int64_t> Environment::observation_shape() const {
  return invaders::environment::observation_shape(config_);
}

// Insert coin, press start, release. One hardware frame each.
void Environment::bring_up() {
  emulator_->reset();
  hold_input(emulator::buttons::kCoin);
  hold_input(emulator::buttons::kP1Start);
  hold_input(0);
}

void Environment::hold_input(uint8_t buttons) {
  emulator_->set_input(buttons);
  emulator_->step_frame();
}

} // namespace invaders::environment
