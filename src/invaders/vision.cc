#include "invaders/vision.h"
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include "stb_image_resize2.h"
#include <stdexcept>

namespace invaders::vision {

std::vector<unsigned char>
resize_grayscale_image(const std::vector<unsigned char> &image, int width,
                       int height, int new_width, int new_height) {
  if (width <= 0 || height <= 0 || new_width <= 0 || new_height <= 0)
    throw std::invalid_argument("Image dimensions must be > 0.");
  if (image.size() != static_cast<size_t>(width) * height)
    throw std::invalid_argument("Expected a grayscale image of size "
                                "width*height.");
  std::vector<unsigned char> resized_image(static_cast<size_t>(new_width) *
                                           new_height);
  auto *result = stbir_resize(image.data(), width, height, 0,
                              resized_image.data(), new_width, new_height, 0,
                              STBIR_1CHANNEL, STBIR_TYPE_UINT8,
                              STBIR_EDGE_CLAMP, STBIR_FILTER_TRIANGLE);
  if (result == nullptr)
    throw std::runtime_error("Failed to resize image.");
  return resized_image;
}

std::vector<unsigned char>
drop_alpha_channel(const std::vector<unsigned char> &image, int width,
                   int height) {
  const size_t pixels = static_cast<size_t>(width) * height;
  if (image.size() != 4 * pixels)
    throw std::invalid_argument("Expected a four channel image of size "
                                "4*width*height.");
  std::vector<unsigned char> rgb(3 * pixels);
  for (size_t i = 0; i < pixels; ++i) {
    rgb[3 * i] = image[4 * i];
    rgb[3 * i + 1] = image[4 * i + 1];
    rgb[3 * i + 2] = image[4 * i + 2];
  }
  return rgb;
}

} // namespace invaders::vision
