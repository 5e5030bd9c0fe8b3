#include "movie-reader.hpp"

#include <opencv2/core/core.hpp>
#include <opencv2/videoio/videoio.hpp>

#define This MovieReader

namespace formcheck
{
This::This()
    : frame_(make_unique<cv::Mat>())
{}

This::~This() { close(); }

bool This::open(string_view fname) noexcept(false)
{
   close();
   video_ = make_unique<cv::VideoCapture>(string(fname));
   if(!video_ || !video_->isOpened()) {
      video_.reset();
      return false;
   }
   frame_no_ = -1;
   n_frames_ = int(video_->get(cv::CAP_PROP_FRAME_COUNT));
   width_    = int(video_->get(cv::CAP_PROP_FRAME_WIDTH));
   height_   = int(video_->get(cv::CAP_PROP_FRAME_HEIGHT));
   return true;
}

void This::close() noexcept
{
   if(video_) video_->release();
   video_.reset();
   if(frame_) frame_->release();
   frame_no_ = -1;
   n_frames_ = width_ = height_ = 0;
}

bool This::is_open() const noexcept { return video_ != nullptr; }

int This::frame_no() const noexcept { return frame_no_; }

int This::n_frames() const noexcept { return n_frames_; }

int This::width() const noexcept { return width_; }

int This::height() const noexcept { return height_; }

bool This::read_next() noexcept(false)
{
   if(!video_) return false;
   if(!video_->read(*frame_) or frame_->empty()) return false;
   ++frame_no_;
   return true;
}

const cv::Mat& This::current_frame() const noexcept
{
   Expects(frame_);
   return *frame_;
}

} // namespace formcheck

#undef This
