#pragma once
#include "invaders/environment/config.h"
#include <cstdint>
#include <torch/torch.h>
#include <variant>

namespace invaders::environment {

struct MultiDiscreteAction {
  // 0 = none, 1 = left, 2 = right.
  int64_t move;
  // 0 = hold, 1 = fire.
  int64_t fire;

  bool operator==(const MultiDiscreteAction &) const = default;
};

// Discrete index for discrete6/discrete4, (move, fire) for multi_discrete.
typedef std::variant<int64_t, MultiDiscreteAction> Action;

class ActionEncoder {
public:
  explicit ActionEncoder(ActionType type);

  // Hardware input bitmask for action. Throws InvalidAction when the action
  // is outside the configured space.
  uint8_t encode(const Action &action) const;

  // Number of distinct actions in the space.
  size_t size() const;
  Action noop() const;
  ActionType type() const { return type_; }

private:
  ActionType type_;
};

// Long tensor: scalar for discrete actions, [move, fire] otherwise.
torch::Tensor to_tensor(const Action &action);

} // namespace invaders::environment
