#pragma once
#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include "uil/types.hpp"

namespace uil
{
    // Decodes `data` into a BGR CV_8UC3 image. `data` is either an embedded
    // base64 payload (a leading "data:image/...;base64," marker is stripped)
    // or a filesystem path; the payload interpretation is tried first.
    // Returns Status::DecodeError and leaves `out` empty when both fail.
    Status load_image(const std::string &data, cv::Mat &out);

    // Decodes an encoded image (PNG, JPEG, ...) held in memory.
    Status decode_image_bytes(const std::vector<uint8_t> &bytes, cv::Mat &out);
}
