#pragma once

#include "formcheck/skeleton/landmark.hpp"

namespace cv
{
class Mat;
}

namespace formcheck
{
// --------------------------------------------------------------- PoseEstimator
// A pose-estimation model handle. Owned by the caller, used by exactly one
// analysis at a time, and opened/closed by the source that drives it.
class PoseEstimator
{
 public:
   virtual ~PoseEstimator() = default;

   virtual bool open() noexcept(false) = 0;
   virtual void close() noexcept        = 0;
   virtual bool is_open() const noexcept = 0;

   // Landmarks for decoded frame `frame_no` (numbered from 1), or nullopt if
   // no pose was found.
   virtual std::optional<PoseFrame> estimate(int frame_no,
                                             const cv::Mat& im,
                                             int width,
                                             int height) noexcept(false)
       = 0;
};

} // namespace formcheck
