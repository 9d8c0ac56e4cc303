#pragma once
#include "invaders/buffer/transition.h"
#include <deque>
#include <optional>

namespace invaders::buffer {

// Sliding window of the last n transitions of one episode.
class NStepAccumulator {
public:
  NStepAccumulator(size_t n, float gamma);

  // Evicts the oldest transition once n are buffered.
  void add(Transition transition);

  // The n-step transition starting at the oldest buffered entry, with the
  // return cut at the first done entry of the window. Empty until n
  // transitions have been added.
  std::optional<Transition> get() const;

  // Must be called at every episode boundary.
  void clear();

  size_t size() const { return window_.size(); }
  size_t n() const { return n_; }
  float gamma() const { return gamma_; }

private:
  size_t n_;
  float gamma_;
  std::deque<Transition> window_;
};

} // namespace invaders::buffer
