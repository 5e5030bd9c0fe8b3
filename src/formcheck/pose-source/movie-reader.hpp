#pragma once

#include "formcheck/foundation.hpp"

namespace cv
{
class Mat;
class VideoCapture;
} // namespace cv

namespace formcheck
{
// Sequential video decoding
struct MovieReader
{
 private:
   int n_frames_ = 0;
   int frame_no_ = -1; // decoded frames, less one
   int width_    = 0;
   int height_   = 0;
   unique_ptr<cv::VideoCapture> video_;
   unique_ptr<cv::Mat> frame_;

 public:
   MovieReader();
   MovieReader(const MovieReader&) = delete;
   ~MovieReader();
   MovieReader& operator=(const MovieReader&) = delete;

   bool open(string_view fname) noexcept(false);
   void close() noexcept;
   bool is_open() const noexcept;

   int frame_no() const noexcept; // -1 before the first `read_next`
   int n_frames() const noexcept; // as reported by the container; may be 0
   int width() const noexcept;
   int height() const noexcept;

   // Decodes the next frame. FALSE at the end of the stream.
   bool read_next() noexcept(false);

   const cv::Mat& current_frame() const noexcept;
};

} // namespace formcheck
