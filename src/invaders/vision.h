#pragma once
#include <vector>

namespace invaders::vision {

// Bilinear (triangle filter) resize of an 8-bit single channel image.
std::vector<unsigned char>
resize_grayscale_image(const std::vector<unsigned char> &image, int width,
                       int height, int new_width, int new_height);

// Keeps the first three bytes of every four byte pixel.
std::vector<unsigned char>
drop_alpha_channel(const std::vector<unsigned char> &image, int width,
                   int height);

} // namespace invaders::vision
