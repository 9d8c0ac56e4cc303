#include "invaders/buffer/prioritized.h"
#include "invaders/errors.h"
#include <ATen/CPUGeneratorImpl.h>
#include <algorithm>
#include <string>

namespace invaders::buffer {

namespace {

std::vector<int64_t> with_leading(int64_t size,
                                  const std::vector<int64_t> &shape) {
  std::vector<int64_t> result = {size};
  result.insert(result.end(), shape.begin(), shape.end());
  return result;
}

void check_shape(const torch::Tensor &tensor,
                 const std::vector<int64_t> &expected, const char *name) {
  if (!tensor.defined() || tensor.sizes() != torch::IntArrayRef(expected))
    throw std::invalid_argument(std::string(name) +
                                " does not match the buffer's shape.");
}

} // namespace

PrioritizedReplayBuffer::PrioritizedReplayBuffer(
    const ReplayConfig &config, std::vector<int64_t> observation_shape,
    std::vector<int64_t> action_shape)
    : capacity_(config.capacity),
      observation_shape_(std::move(observation_shape)),
      action_shape_(std::move(action_shape)), alpha_(config.alpha),
      beta_(config.beta), beta_increment_(config.beta_increment),
      epsilon_(config.epsilon), size_(0), insertions_(0),
      generator_(at::make_generator<at::CPUGeneratorImpl>(config.seed)) {
  validate(config);
  auto capacity = static_cast<int64_t>(capacity_);
  auto options = torch::TensorOptions();
  states_ = torch::zeros(with_leading(capacity, observation_shape_),
                         options.dtype(torch::kByte));
  next_states_ = torch::zeros_like(states_);
  actions_ = torch::zeros(with_leading(capacity, action_shape_),
                          options.dtype(torch::kLong));
  rewards_ = torch::zeros({capacity}, options.dtype(torch::kFloat32));
  dones_ = torch::zeros({capacity}, options.dtype(torch::kBool));
  priorities_ = torch::zeros({capacity}, options.dtype(torch::kFloat32));
}

void PrioritizedReplayBuffer::add(const Transition &transition) {
  check_shape(transition.state, observation_shape_, "State");
  check_shape(transition.next_state, observation_shape_, "Next state");
  check_shape(transition.action, action_shape_, "Action");

  float max_priority =
      size_ > 0
          ? priorities_.slice(0, 0, static_cast<int64_t>(size_))
                .max()
                .item<float>()
          : 1.0f;

  auto slot = static_cast<int64_t>(insertions_ % capacity_);
  states_.select(0, slot).copy_(transition.state);
  next_states_.select(0, slot).copy_(transition.next_state);
  actions_.select(0, slot).copy_(transition.action);
  rewards_[slot] = transition.reward;
  dones_[slot] = transition.done;
  priorities_[slot] = max_priority;

  insertions_++;
  size_ = std::min(size_ + 1, capacity_);
}

Batch PrioritizedReplayBuffer::sample(size_t batch_size) {
  if (size_ == 0)
    throw EmptyBufferError("Cannot sample from an empty buffer.");
  if (batch_size == 0)
    throw std::invalid_argument("Batch size must be greater than 0.");
  if (batch_size > size_)
    throw InsufficientPopulationError(
        "Cannot sample " + std::to_string(batch_size) +
        " distinct entries from a buffer holding " + std::to_string(size_) +
        ".");

  auto size = static_cast<int64_t>(size_);
  auto probabilities =
      priorities_.slice(0, 0, size).to(torch::kFloat64).pow(alpha_);
  probabilities.div_(probabilities.sum());

  // Without replacement, so every slot appears at most once.
  auto indices = torch::multinomial(probabilities,
                                    static_cast<int64_t>(batch_size),
                                    /*replacement=*/false, generator_);

  auto weights = (probabilities.index_select(0, indices) * size)
                     .pow(-static_cast<double>(beta_));
  weights.div_(weights.max());

  beta_ = std::min(1.0f, beta_ + beta_increment_);

  return Batch{.states = states_.index_select(0, indices),
               .actions = actions_.index_select(0, indices),
               .rewards = rewards_.index_select(0, indices),
               .next_states = next_states_.index_select(0, indices),
               .dones = dones_.index_select(0, indices),
               .indices = indices,
               .weights = weights.to(torch::kFloat32)};
}

void PrioritizedReplayBuffer::update_priorities(
    const torch::Tensor &indices, const torch::Tensor &td_errors) {
  if (indices.dim() != 1 || td_errors.dim() != 1)
    throw std::invalid_argument("Indices and TD errors must be 1D.");
  if (indices.size(0) != td_errors.size(0))
    throw std::invalid_argument(
        "Indices and TD errors must have the same length.");
  auto slots = indices.to(torch::kCPU, torch::kLong).contiguous();
  auto errors = td_errors.detach().to(torch::kCPU, torch::kFloat32);
  if (!torch::isfinite(errors).all().item<bool>())
    throw std::invalid_argument("TD errors must be finite.");
  const int64_t *slot_data = slots.data_ptr<int64_t>();
  for (int64_t i = 0; i < slots.numel(); ++i)
    check_slot(slot_data[i]);
  priorities_.index_copy_(0, slots, errors.abs() + epsilon_);
}

void PrioritizedReplayBuffer::update_priorities(
    const std::vector<int64_t> &indices, const std::vector<float> &td_errors) {
  if (indices.size() != td_errors.size())
    throw std::invalid_argument(
        "Indices and TD errors must have the same length.");
  update_priorities(torch::tensor(indices, torch::kLong),
                    torch::tensor(td_errors, torch::kFloat32));
}

Transition PrioritizedReplayBuffer::at(size_t slot) const {
  check_slot(static_cast<int64_t>(slot));
  auto index = static_cast<int64_t>(slot);
  return Transition{.state = states_.select(0, index).clone(),
                    .action = actions_.select(0, index).clone(),
                    .reward = rewards_[index].item<float>(),
                    .next_state = next_states_.select(0, index).clone(),
                    .done = dones_[index].item<bool>()};
}

float PrioritizedReplayBuffer::priority(size_t slot) const {
  check_slot(static_cast<int64_t>(slot));
  return priorities_[static_cast<int64_t>(slot)].item<float>();
}

void PrioritizedReplayBuffer::check_slot(int64_t slot) const {
  if (slot < 0 || slot >= static_cast<int64_t>(size_))
    throw std::out_of_range("Slot " + std::to_string(slot) +
                            " is outside the stored entries.");
}

} // namespace invaders::buffer
