#include "fake_emulator.h"
#include "invaders/emulator/emulator.h"
#include "invaders/environment/environment.h"
#include "invaders/errors.h"
#include "gtest/gtest.h"
#include <memory>
#include <stdexcept>
#include <torch/torch.h>

using invaders::environment::Action;
using invaders::environment::Config;
using invaders::environment::Environment;
using invaders::environment::ObservationType;
using invaders::environment::Phase;
using invaders::environment::RewardType;
namespace buttons = invaders::emulator::buttons;

class EnvironmentTest : public ::testing::Test {
protected:
  std::unique_ptr<Environment> make_environment(Config config) {
    auto emulator = std::make_unique<FakeEmulator>();
    emulator_ = emulator.get();
    return std::make_unique<Environment>(std::move(emulator),
                                         std::move(config));
  }

  // Steps through every discrete action in turn and returns the inputs the
  // hardware held since the last reset.
  std::vector<uint8_t> play(Environment &env, const FakeEmulator &emulator,
                            int steps) {
    for (int i = 0; i < steps; ++i)
      env.step(Action{int64_t{i % 6}});
    return emulator.held_inputs;
  }

  // Owned by the environment under test.
  FakeEmulator *emulator_ = nullptr;
};

TEST_F(EnvironmentTest, ResetRunsBringUpSequence) {
  auto env = make_environment(Config{});
  emulator_->current_lives = 3;
  auto reset = env->reset();

  EXPECT_EQ(emulator_->resets, 1);
  EXPECT_EQ(emulator_->held_inputs,
            std::vector<uint8_t>({buttons::kCoin, buttons::kP1Start, 0}));
  EXPECT_EQ(reset.info.score, 0u);
  EXPECT_EQ(reset.info.lives, 3);
  EXPECT_EQ(reset.info.level, 1);
  EXPECT_EQ(reset.info.frame_count, 3u);
  EXPECT_EQ(reset.observation.sizes(), std::vector<int64_t>({224, 256}));
  EXPECT_EQ(env->phase(), Phase::kEpisodeActive);
}

TEST_F(EnvironmentTest, ResetFromStateFileSkipsBringUp) {
  auto env = make_environment(Config{});
  env->reset(std::nullopt, {.state_file = "wave3.state"});
  EXPECT_EQ(emulator_->resets, 0);
  EXPECT_TRUE(emulator_->held_inputs.empty());
  ASSERT_EQ(emulator_->loaded.size(), 1u);
  EXPECT_EQ(emulator_->loaded[0].string(), "wave3.state");
}

TEST_F(EnvironmentTest, StepReturnsWellFormedResult) {
  auto env = make_environment(Config{});
  env->reset();
  emulator_->current_score = 30;
  auto step = env->step(Action{int64_t{1}});

  EXPECT_EQ(step.observation.sizes(), std::vector<int64_t>({224, 256}));
  EXPECT_FLOAT_EQ(step.reward, 30.0f);
  EXPECT_FALSE(step.terminated);
  EXPECT_FALSE(step.truncated);
  EXPECT_EQ(step.info.score, 30u);
  EXPECT_EQ(step.info.total_score, 30u);
  EXPECT_EQ(step.info.score_delta, 30);
  EXPECT_EQ(step.info.lives, 3);
  EXPECT_EQ(step.info.lives_lost, 0);
  EXPECT_EQ(step.info.steps, 1u);
  EXPECT_EQ(step.info.frame_count, 4u);
  EXPECT_EQ(emulator_->held_inputs.back(), buttons::kP1Fire);
}

TEST_F(EnvironmentTest, FrameSkipHoldsInputAndReadsCountersOnce) {
  Config config;
  config.frame_skip = 4;
  auto env = make_environment(config);
  env->reset();
  emulator_->held_inputs.clear();
  emulator_->score_reads = 0;

  env->step(Action{int64_t{2}});
  EXPECT_EQ(emulator_->held_inputs,
            std::vector<uint8_t>(4, buttons::kLeft));
  EXPECT_EQ(emulator_->score_reads, 1);
}

TEST_F(EnvironmentTest, DeltasAreRelativeToPreviousStep) {
  Config config;
  config.reward_type = RewardType::kShaped;
  auto env = make_environment(config);
  env->reset();

  emulator_->current_score = 50;
  emulator_->current_lives = 2;
  auto first = env->step(Action{int64_t{0}});
  EXPECT_EQ(first.info.score_delta, 50);
  EXPECT_EQ(first.info.lives_lost, 1);
  EXPECT_FLOAT_EQ(first.reward, -49.9f);

  emulator_->current_score = 60;
  auto second = env->step(Action{int64_t{0}});
  EXPECT_EQ(second.info.score_delta, 10);
  EXPECT_EQ(second.info.lives_lost, 0);
  EXPECT_EQ(env->episode().prev_score, 60u);
  EXPECT_EQ(env->episode().prev_lives, 2);
}

TEST_F(EnvironmentTest, GameOverTerminatesAndBlocksFurtherSteps) {
  Config config;
  config.reward_type = RewardType::kTerminal;
  auto env = make_environment(config);
  env->reset();

  emulator_->current_score = 120;
  emulator_->is_game_over = true;
  auto step = env->step(Action{int64_t{0}});
  EXPECT_TRUE(step.terminated);
  EXPECT_FALSE(step.truncated);
  EXPECT_TRUE(step.info.terminated);
  EXPECT_FLOAT_EQ(step.reward, 120.0f);
  EXPECT_EQ(env->phase(), Phase::kEpisodeDone);

  EXPECT_THROW(env->step(Action{int64_t{0}}), invaders::StaleEpisodeError);
  EXPECT_EQ(env->episode().steps, 1u);

  emulator_->is_game_over = false;
  env->reset();
  EXPECT_NO_THROW(env->step(Action{int64_t{0}}));
}

TEST_F(EnvironmentTest, TruncatesAtMaxEpisodeSteps) {
  Config config;
  config.max_episode_steps = 3;
  auto env = make_environment(config);
  env->reset();
  EXPECT_FALSE(env->step(Action{int64_t{0}}).truncated);
  EXPECT_FALSE(env->step(Action{int64_t{0}}).truncated);
  auto last = env->step(Action{int64_t{0}});
  EXPECT_TRUE(last.truncated);
  EXPECT_FALSE(last.terminated);
  EXPECT_THROW(env->step(Action{int64_t{0}}), invaders::StaleEpisodeError);
}

TEST_F(EnvironmentTest, StepBeforeResetIsRejected) {
  auto env = make_environment(Config{});
  EXPECT_EQ(env->phase(), Phase::kReady);
  EXPECT_THROW(env->step(Action{int64_t{0}}), invaders::StaleEpisodeError);
}

TEST_F(EnvironmentTest, InvalidActionLeavesEpisodeUntouched) {
  auto env = make_environment(Config{});
  env->reset();
  auto frames = emulator_->held_inputs.size();
  EXPECT_THROW(env->step(Action{int64_t{6}}), invaders::InvalidAction);
  EXPECT_EQ(emulator_->held_inputs.size(), frames);
  EXPECT_EQ(env->episode().steps, 0u);
}

TEST_F(EnvironmentTest, StickyActionsRepeatThePreviousAction) {
  Config config;
  config.repeat_action_probability = 1.0f;
  auto env = make_environment(config);
  env->reset();

  // The first previous action of an episode is the no-op.
  env->step(Action{int64_t{3}});
  EXPECT_EQ(emulator_->held_inputs.back(), 0);
  env->step(Action{int64_t{1}});
  EXPECT_EQ(emulator_->held_inputs.back(), 0);
}

TEST_F(EnvironmentTest, NoStickyActionsWhenProbabilityIsZero) {
  auto env = make_environment(Config{});
  env->reset();
  env->step(Action{int64_t{3}});
  EXPECT_EQ(emulator_->held_inputs.back(), buttons::kRight);
  env->step(Action{int64_t{2}});
  EXPECT_EQ(emulator_->held_inputs.back(), buttons::kLeft);
  EXPECT_EQ(env->episode().last_action, Action{int64_t{2}});
}

TEST_F(EnvironmentTest, StickyActionsAreReproducibleForASeed) {
  Config config;
  config.repeat_action_probability = 0.5f;
  config.seed = 11;
  auto first = make_environment(config);
  auto *first_emulator = emulator_;
  auto second = make_environment(config);
  auto *second_emulator = emulator_;

  first->reset();
  second->reset();
  auto first_inputs = play(*first, *first_emulator, 40);
  auto second_inputs = play(*second, *second_emulator, 40);
  EXPECT_EQ(first_inputs, second_inputs);

  // Some of the 40 requests must have been replaced by the previous action.
  auto requested = make_environment(Config{});
  requested->reset();
  EXPECT_NE(first_inputs, play(*requested, *emulator_, 40));
}

TEST_F(EnvironmentTest, ResetWithSeedReseedsStickyActions) {
  Config config;
  config.repeat_action_probability = 0.5f;
  auto env = make_environment(config);
  auto *hardware = emulator_;

  env->reset(7);
  auto first = play(*env, *hardware, 40);
  env->reset(7);
  auto second = play(*env, *hardware, 40);
  EXPECT_EQ(first, second);

  config.seed = 7;
  auto seeded = make_environment(config);
  seeded->reset();
  EXPECT_EQ(play(*seeded, *emulator_, 40), first);
}

TEST_F(EnvironmentTest, FrameStackAfterResetRepeatsCurrentFrame) {
  Config config;
  config.frame_stack = 4;
  auto env = make_environment(config);
  auto reset = env->reset();
  ASSERT_EQ(reset.observation.sizes(), std::vector<int64_t>({4, 224, 256}));
  for (int64_t i = 1; i < 4; ++i)
    EXPECT_TRUE(torch::equal(reset.observation[i], reset.observation[0]));

  auto step = env->step(Action{int64_t{0}});
  EXPECT_TRUE(torch::equal(step.observation[2], reset.observation[0]));
  EXPECT_FALSE(torch::equal(step.observation[3], reset.observation[0]));
}

TEST_F(EnvironmentTest, ResetClearsEpisodeState) {
  Config config;
  config.frame_stack = 2;
  auto env = make_environment(config);
  env->reset();
  emulator_->current_score = 90;
  env->step(Action{int64_t{1}});
  env->step(Action{int64_t{1}});

  emulator_->current_score = 0;
  auto reset = env->reset();
  EXPECT_EQ(env->episode().steps, 0u);
  EXPECT_EQ(env->episode().prev_score, 0u);
  EXPECT_EQ(env->episode().episode_score, 0u);
  EXPECT_EQ(env->episode().last_action, Action{int64_t{0}});
  EXPECT_TRUE(torch::equal(reset.observation[0], reset.observation[1]));
}

TEST_F(EnvironmentTest, MultiDiscreteEnvironment) {
  Config config;
  config.action_type = invaders::environment::ActionType::kMultiDiscrete;
  auto env = make_environment(config);
  env->reset();
  env->step(invaders::environment::MultiDiscreteAction{2, 1});
  EXPECT_EQ(emulator_->held_inputs.back(), buttons::kRight | buttons::kP1Fire);
  EXPECT_THROW(env->step(Action{int64_t{1}}), invaders::InvalidAction);
}

TEST_F(EnvironmentTest, SaveAndLoadStatePassThrough) {
  auto env = make_environment(Config{});
  env->save_state("checkpoint.state");
  env->load_state("checkpoint.state");
  ASSERT_EQ(emulator_->saved.size(), 1u);
  ASSERT_EQ(emulator_->loaded.size(), 1u);
  EXPECT_EQ(emulator_->saved[0].string(), "checkpoint.state");
}

TEST_F(EnvironmentTest, StateFailuresAreSurfaced) {
  auto env = make_environment(Config{});
  emulator_->fail_state_io = true;
  EXPECT_THROW(env->save_state("checkpoint.state"), invaders::EmulatorFailure);
  EXPECT_THROW(env->load_state("checkpoint.state"), invaders::EmulatorFailure);
  EXPECT_THROW(env->reset(std::nullopt, {.state_file = "checkpoint.state"}),
               invaders::EmulatorFailure);
}

TEST_F(EnvironmentTest, InvalidConfigurationIsRejected) {
  Config custom;
  custom.reward_type = RewardType::kCustom;
  EXPECT_THROW(make_environment(custom), invaders::ConfigurationError);

  Config skip;
  skip.frame_skip = 0;
  EXPECT_THROW(make_environment(skip), invaders::ConfigurationError);

  Config stack;
  stack.frame_stack = 0;
  EXPECT_THROW(make_environment(stack), invaders::ConfigurationError);

  Config sticky;
  sticky.repeat_action_probability = 1.5f;
  EXPECT_THROW(make_environment(sticky), invaders::ConfigurationError);

  Config steps;
  steps.max_episode_steps = 0;
  EXPECT_THROW(make_environment(steps), invaders::ConfigurationError);
}

TEST_F(EnvironmentTest, CustomRewardSeesTheInfoRecord) {
  Config config;
  config.reward_type = RewardType::kCustom;
  config.reward_function = [](const invaders::environment::Info &info) {
    return static_cast<float>(info.steps);
  };
  auto env = make_environment(config);
  env->reset();
  env->step(Action{int64_t{0}});
  EXPECT_FLOAT_EQ(env->step(Action{int64_t{0}}).reward, 2.0f);
}

TEST_F(EnvironmentTest, ThrowingRewardFunctionLeavesEpisodeUntouched) {
  Config config;
  config.reward_type = RewardType::kCustom;
  config.reward_function = [](const invaders::environment::Info &info) {
    if (info.score_delta > 0)
      throw std::runtime_error("reward failed");
    return 0.0f;
  };
  auto env = make_environment(config);
  emulator_->current_lives = 3;
  env->reset();
  env->step(Action{int64_t{2}});

  emulator_->current_score = 40;
  emulator_->current_lives = 2;
  EXPECT_THROW(env->step(Action{int64_t{3}}), std::runtime_error);
  EXPECT_EQ(env->episode().steps, 1u);
  EXPECT_EQ(env->episode().prev_score, 0u);
  EXPECT_EQ(env->episode().prev_lives, 3);
  EXPECT_EQ(env->episode().last_action, Action{int64_t{2}});
  EXPECT_EQ(env->phase(), Phase::kEpisodeActive);
}

TEST_F(EnvironmentTest, DownscaledObservationShape) {
  Config config;
  config.observation_type = ObservationType::kDownscaled;
  config.frame_stack = 4;
  auto env = make_environment(config);
  auto reset = env->reset();
  EXPECT_EQ(reset.observation.sizes(), std::vector<int64_t>({4, 84, 84}));
  EXPECT_EQ(env->observation_shape(), std::vector<int64_t>({4, 84, 84}));
}
