#pragma once
#include "invaders/emulator/emulator.h"
#include "invaders/environment/config.h"
#include <deque>
#include <torch/torch.h>

namespace invaders::environment {

// Reads the current frame from the hardware and stacks it with the most
// recent frames of the episode.
class ObservationComposer {
public:
  ObservationComposer(ObservationType type, size_t frame_stack);

  // Returns a fresh uint8 tensor. Until frame_stack frames have been seen the
  // window is padded with copies of the current frame. Ram is not stacked.
  torch::Tensor compose(emulator::VirtualEmulator &hardware);
  void clear();
  size_t size() const { return frames_.size(); }

private:
  torch::Tensor read_frame(emulator::VirtualEmulator &hardware);

  ObservationType type_;
  size_t frame_stack_;
  std::deque<torch::Tensor> frames_;
  emulator::ScreenBuffer screen_buffer_;
};

} // namespace invaders::environment
