#include "invaders/environment/observation.h"
#include "invaders/vision.h"
#include <stdexcept>

namespace invaders::environment {

namespace {

torch::Tensor frame_tensor(const std::vector<unsigned char> &data,
                           std::vector<int64_t> shape) {
  // from_blob does not own the memory, so the clone is required.
  return torch::from_blob(const_cast<unsigned char *>(data.data()), shape,
                          torch::kByte)
      .clone();
}

} // namespace

ObservationComposer::ObservationComposer(ObservationType type,
                                         size_t frame_stack)
    : type_(type), frame_stack_(frame_stack) {
  if (frame_stack_ == 0)
    throw std::invalid_argument("Frame stack must be greater than 0.");
}

torch::Tensor
ObservationComposer::compose(emulator::VirtualEmulator &hardware) {
  auto frame = read_frame(hardware);
  // The ram placeholder is never stacked.
  if (type_ == ObservationType::kRam || frame_stack_ == 1)
    return frame;
  frames_.push_back(frame);
  while (frames_.size() > frame_stack_)
    frames_.pop_front();
  while (frames_.size() < frame_stack_)
    frames_.push_front(frame);
  return torch::stack(std::vector<torch::Tensor>(frames_.begin(), frames_.end()),
                      0);
}

void ObservationComposer::clear() { frames_.clear(); }

torch::Tensor
ObservationComposer::read_frame(emulator::VirtualEmulator &hardware) {
  const int width = emulator::kScreenWidth;
  const int height = emulator::kScreenHeight;
  switch (type_) {
  case ObservationType::kGrayscale:
    hardware.get_screen_grayscale(screen_buffer_);
    return frame_tensor(screen_buffer_, {height, width});
  case ObservationType::kRgb:
    hardware.get_screen_argb(screen_buffer_);
    return frame_tensor(
        vision::drop_alpha_channel(screen_buffer_, width, height),
        {height, width, 3});
  case ObservationType::kDownscaled:
    hardware.get_screen_grayscale(screen_buffer_);
    return frame_tensor(vision::resize_grayscale_image(
                            screen_buffer_, width, height, kDownscaledSize,
                            kDownscaledSize),
                        {kDownscaledSize, kDownscaledSize});
  case ObservationType::kRam:
    // The memory map is not exposed yet; agents trained so far have only
    // ever seen zeros here.
    return torch::zeros({static_cast<int64_t>(emulator::kRamSize)},
                        torch::kByte);
  }
  throw std::logic_error("Unhandled observation type.");
}

} // namespace invaders::environment
