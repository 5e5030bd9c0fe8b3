#include "video-pose-source.hpp"

#define This VideoPoseSource

namespace formcheck
{
This::This(const string_view fname, PoseEstimator& estimator)
    : fname_(fname)
    , estimator_(estimator)
{}

This::~This() { close(); }

bool This::open() noexcept(false)
{
   close();
   if(!movie_.open(fname_)) {
      WARN(format("failed to open video file '{}'", fname_));
      return false;
   }
   if(!estimator_.open()) {
      WARN("failed to open the pose estimator");
      movie_.close();
      return false;
   }
   return true;
}

void This::close() noexcept
{
   movie_.close();
   estimator_.close();
}

bool This::is_open() const noexcept
{
   return movie_.is_open() and estimator_.is_open();
}

bool This::advance() noexcept(false)
{
   return is_open() and movie_.read_next();
}

std::optional<PoseFrame> This::detect(int width, int height) noexcept(false)
{
   Expects(is_open());
   return estimator_.estimate(
       frame_no(), movie_.current_frame(), width, height);
}

} // namespace formcheck

#undef This
