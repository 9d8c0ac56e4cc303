#pragma once
#include <torch/torch.h>

namespace invaders::buffer {

struct Transition {
  torch::Tensor state;
  torch::Tensor action;
  float reward;
  torch::Tensor next_state;
  // Terminated or truncated when the transition was captured.
  bool done;
};

} // namespace invaders::buffer
