#include "invaders/environment/reward.h"
#include "invaders/errors.h"

namespace invaders::environment {

namespace {
constexpr float kLifeLostPenalty = 100.0f;
constexpr float kSurvivalBonus = 0.1f;
} // namespace

float ScoreDeltaReward::operator()(const Info &info) const {
  return static_cast<float>(info.score_delta);
}

float ShapedReward::operator()(const Info &info) const {
  float reward = static_cast<float>(info.score_delta);
  // An extra life shows up as a negative loss and is not rewarded.
  if (info.lives_lost > 0)
    reward -= kLifeLostPenalty * static_cast<float>(info.lives_lost);
  if (!info.terminated)
    reward += kSurvivalBonus;
  return reward;
}

float TerminalReward::operator()(const Info &info) const {
  if (info.terminated)
    return static_cast<float>(info.total_score);
  return 0.0f;
}

CustomReward::CustomReward(RewardFunction function)
    : function_(std::move(function)) {
  if (!function_)
    throw ConfigurationError(
        "reward_function must be provided when reward_type is custom.");
}

float CustomReward::operator()(const Info &info) const {
  return function_(info);
}

std::unique_ptr<RewardPolicy> make_reward_policy(RewardType type,
                                                 RewardFunction function) {
  switch (type) {
  case RewardType::kScoreDelta:
    return std::make_unique<ScoreDeltaReward>();
  case RewardType::kShaped:
    return std::make_unique<ShapedReward>();
  case RewardType::kTerminal:
    return std::make_unique<TerminalReward>();
  case RewardType::kCustom:
    return std::make_unique<CustomReward>(std::move(function));
  }
  throw ConfigurationError("Unknown reward type.");
}

} // namespace invaders::environment
