#pragma once
#include "invaders/environment/config.h"
#include "invaders/environment/info.h"
#include <memory>

namespace invaders::environment {

// Scalar reward for one step, chosen once at construction.
class RewardPolicy {
public:
  virtual ~RewardPolicy() = default;
  virtual float operator()(const Info &info) const = 0;
};

// The raw score change of the step.
class ScoreDeltaReward : public RewardPolicy {
public:
  float operator()(const Info &info) const override;
};

// Score change, minus 100 per life actually lost, plus a 0.1 survival bonus on
// every step that does not end the game.
class ShapedReward : public RewardPolicy {
public:
  float operator()(const Info &info) const override;
};

// Zero until the game ends, then the episode's total score.
class TerminalReward : public RewardPolicy {
public:
  float operator()(const Info &info) const override;
};

class CustomReward : public RewardPolicy {
public:
  explicit CustomReward(RewardFunction function);
  float operator()(const Info &info) const override;

private:
  RewardFunction function_;
};

std::unique_ptr<RewardPolicy> make_reward_policy(RewardType type,
                                                 RewardFunction function = {});

} // namespace invaders::environment
