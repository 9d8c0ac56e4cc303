#include "invaders/buffer/n_step.h"
#include <stdexcept>

namespace invaders::buffer {

NStepAccumulator::NStepAccumulator(size_t n, float gamma)
    : n_(n), gamma_(gamma) {
  if (n_ == 0)
    throw std::invalid_argument("N must be greater than 0.");
  if (!(gamma_ >= 0.0f && gamma_ <= 1.0f))
    throw std::invalid_argument("Gamma must be within [0, 1].");
}

void NStepAccumulator::add(Transition transition) {
  window_.push_back(std::move(transition));
  while (window_.size() > n_)
    window_.pop_front();
}

std::optional<Transition> NStepAccumulator::get() const {
  if (window_.size() < n_)
    return std::nullopt;

  size_t last = window_.size() - 1;
  double discounted_return = 0.0;
  double discount = 1.0;
  for (size_t i = 0; i < window_.size(); ++i) {
    discounted_return += discount * window_[i].reward;
    discount *= gamma_;
    if (window_[i].done) {
      last = i;
      break;
    }
  }

  const auto &first = window_.front();
  const auto &bootstrap = window_[last];
  return Transition{.state = first.state,
                    .action = first.action,
                    .reward = static_cast<float>(discounted_return),
                    .next_state = bootstrap.next_state,
                    .done = bootstrap.done};
}

void NStepAccumulator::clear() { window_.clear(); }

} // namespace invaders::buffer
