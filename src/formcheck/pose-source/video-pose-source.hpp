#pragma once

#include "movie-reader.hpp"
#include "pose-estimator.hpp"
#include "pose-frame-source.hpp"

namespace formcheck
{
// ------------------------------------------------------------ VideoPoseSource
// Decodes a video file, and hands each frame to a caller-owned estimator.
// The estimator is opened and closed along with the video.
class VideoPoseSource final : public PoseFrameSource
{
 private:
   string fname_;
   PoseEstimator& estimator_;
   MovieReader movie_;

 public:
   VideoPoseSource(const string_view fname, PoseEstimator& estimator);
   VideoPoseSource(const VideoPoseSource&) = delete;
   ~VideoPoseSource() override;
   VideoPoseSource& operator=(const VideoPoseSource&) = delete;

   bool open() noexcept(false) override;
   void close() noexcept override;
   bool is_open() const noexcept override;

   int frame_width() const noexcept override { return movie_.width(); }
   int frame_height() const noexcept override { return movie_.height(); }

   bool advance() noexcept(false) override;
   int frame_no() const noexcept override { return movie_.frame_no() + 1; }
   std::optional<PoseFrame> detect(int width, int height) noexcept(false)
       override;
};

} // namespace formcheck
