#pragma once
#include "invaders/buffer/config.h"
#include "invaders/buffer/transition.h"
#include <torch/torch.h>
#include <vector>

namespace invaders::buffer {

struct Batch {
  torch::Tensor states;
  torch::Tensor actions;
  torch::Tensor rewards;
  torch::Tensor next_states;
  torch::Tensor dones;
  // Slots of the sampled entries, for update_priorities.
  torch::Tensor indices;
  // Importance sampling weights, normalised so the largest is 1.
  torch::Tensor weights;
};

// Fixed capacity ring buffer sampled in proportion to priority^alpha.
class PrioritizedReplayBuffer {
public:
  PrioritizedReplayBuffer(const ReplayConfig &config,
                          std::vector<int64_t> observation_shape,
                          std::vector<int64_t> action_shape = {});

  // Stores the transition at slot insertions % capacity with the current
  // maximum priority, or 1 when the buffer is empty.
  void add(const Transition &transition);

  // Draws batch_size distinct slots and anneals beta.
  Batch sample(size_t batch_size);

  // priority = |td_error| + epsilon.
  void update_priorities(const torch::Tensor &indices,
                         const torch::Tensor &td_errors);
  void update_priorities(const std::vector<int64_t> &indices,
                         const std::vector<float> &td_errors);

  Transition at(size_t slot) const;
  float priority(size_t slot) const;

  size_t size() const { return size_; }
  size_t capacity() const { return capacity_; }
  bool empty() const { return size_ == 0; }
  size_t insertions() const { return insertions_; }
  float alpha() const { return alpha_; }
  float beta() const { return beta_; }

private:
  void check_slot(int64_t slot) const;

  size_t capacity_;
  std::vector<int64_t> observation_shape_;
  std::vector<int64_t> action_shape_;
  float alpha_;
  float beta_;
  float beta_increment_;
  float epsilon_;
  size_t size_;
  size_t insertions_;
  at::Generator generator_;

  torch::Tensor states_;
  torch::Tensor actions_;
  torch::Tensor rewards_;
  torch::Tensor next_states_;
  torch::Tensor dones_;
  torch::Tensor priorities_;
};

} // namespace invaders::buffer
