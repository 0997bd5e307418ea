#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

/*
    Defines a decoded video frame and the request that carries it to an external worker
*/

namespace psp {

using TimePoint = std::chrono::steady_clock::time_point;

struct Frame {
  // Position in the capture; logical indices downstream count requests, not capture positions
  std::uint64_t frame_number{0};

  // Monotonic timestamp when frame was read
  TimePoint capture_time;

  // Image data (shared, ref-counted)
  cv::Mat image;
};

// Encoded image handed to the worker, plus the dimensions of the image it came from
struct FramePayload {
  std::vector<std::uint8_t> bytes;
  cv::Size image_size{};
};

// One unit of dispatch work
struct FrameRequest {
  std::uint64_t frame_number{0};
  FramePayload payload;
};

} // namespace psp
