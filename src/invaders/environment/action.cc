#include "invaders/environment/action.h"
#include "invaders/emulator/emulator.h"
#include "invaders/errors.h"
#include <array>
#include <string>

namespace invaders::environment {

namespace {

using namespace invaders::emulator::buttons;

constexpr std::array<uint8_t, 6> kDiscrete6 = {
    0, kP1Fire, kLeft, kRight, kLeft | kP1Fire, kRight | kP1Fire};
constexpr std::array<uint8_t, 4> kDiscrete4 = {0, kP1Fire, kLeft, kRight};

template <size_t N>
uint8_t lookup(const std::array<uint8_t, N> &table, const Action &action) {
  const auto *index = std::get_if<int64_t>(&action);
  if (index == nullptr)
    throw InvalidAction("Expected a discrete action index.");
  if (*index < 0 || *index >= static_cast<int64_t>(N))
    throw InvalidAction("Action " + std::to_string(*index) +
                        " is outside [0, " + std::to_string(N) + ").");
  return table[static_cast<size_t>(*index)];
}

} // namespace

ActionEncoder::ActionEncoder(ActionType type) : type_(type) {}

uint8_t ActionEncoder::encode(const Action &action) const {
  switch (type_) {
  case ActionType::kDiscrete6:
    return lookup(kDiscrete6, action);
  case ActionType::kDiscrete4:
    return lookup(kDiscrete4, action);
  case ActionType::kMultiDiscrete:
    break;
  }
  const auto *pair = std::get_if<MultiDiscreteAction>(&action);
  if (pair == nullptr)
    throw InvalidAction("Expected a (move, fire) action.");
  if (pair->move < 0 || pair->move > 2)
    throw InvalidAction("Move " + std::to_string(pair->move) +
                        " is outside [0, 3).");
  if (pair->fire < 0 || pair->fire > 1)
    throw InvalidAction("Fire " + std::to_string(pair->fire) +
                        " is outside [0, 2).");
  uint8_t bitmask = 0;
  if (pair->move == 1)
    bitmask |= kLeft;
  else if (pair->move == 2)
    bitmask |= kRight;
  if (pair->fire == 1)
    bitmask |= kP1Fire;
  return bitmask;
}

size_t ActionEncoder::size() const {
  switch (type_) {
  case ActionType::kDiscrete6:
    return kDiscrete6.size();
  case ActionType::kDiscrete4:
    return kDiscrete4.size();
  case ActionType::kMultiDiscrete:
    return 3 * 2;
  }
  return 0;
}

Action ActionEncoder::noop() const {
  if (type_ == ActionType::kMultiDiscrete)
    return MultiDiscreteAction{0, 0};
  return int64_t{0};
}

torch::Tensor to_tensor(const Action &action) {
  if (const auto *index = std::get_if<int64_t>(&action))
    return torch::tensor(*index, torch::kLong);
  const auto &pair = std::get<MultiDiscreteAction>(action);
  return torch::tensor({pair.move, pair.fire}, torch::kLong);
}

} // namespace invaders::environment
