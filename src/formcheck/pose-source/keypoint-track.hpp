#pragma once

#include "pose-estimator.hpp"
#include "pose-frame-source.hpp"

namespace Json
{
class Value;
}

namespace formcheck
{
// --------------------------------------------------------------- KeypointTrack
// A recorded landmark track. On disk:
//
//    {"width": 1280, "height": 720,
//     "frames": [{"frame": 1, "landmarks": {"L_HIP": [x, y, visibility], ...}},
//                {"frame": 2, "landmarks": null}, ...]}
//
// Coordinates are normalized. "frame" defaults to the 1-based position in
// the array, and landmark names are case-insensitive.
struct KeypointTrack
{
   struct Entry
   {
      int frame_no = 0;
      std::optional<PoseFrame> pose;
   };

   int width  = 0; // 0 if unknown
   int height = 0;
   vector<Entry> frames;

   size_t size() const noexcept { return frames.size(); }
   bool empty() const noexcept { return frames.empty(); }

   // nullptr if `frame_no` is not in the track
   const Entry* find(int frame_no) const noexcept;

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;
   friend string str(const KeypointTrack& o) noexcept { return o.to_string(); }
};

// These throw std::runtime_error on malformed input
KeypointTrack read_keypoint_track(const Json::Value& o) noexcept(false);
KeypointTrack load_keypoint_track(const string_view fname) noexcept(false);

// --------------------------------------------------------- KeypointTrackSource
// Replays a track in order, one frame per `advance`.
class KeypointTrackSource final : public PoseFrameSource
{
 private:
   string fname_; // empty when constructed from memory
   KeypointTrack track_;
   bool is_open_    = false;
   size_t position_ = 0; // frames advanced over

 public:
   explicit KeypointTrackSource(const string_view fname);
   explicit KeypointTrackSource(KeypointTrack track);

   bool open() noexcept(false) override;
   void close() noexcept override;
   bool is_open() const noexcept override { return is_open_; }

   int frame_width() const noexcept override { return track_.width; }
   int frame_height() const noexcept override { return track_.height; }

   bool advance() noexcept(false) override;
   int frame_no() const noexcept override;
   std::optional<PoseFrame> detect(int width, int height) noexcept(false)
       override;
};

// ---------------------------------------------------------- TrackPoseEstimator
// Serves precomputed landmarks for each decoded frame number.
class TrackPoseEstimator final : public PoseEstimator
{
 private:
   KeypointTrack track_;
   bool is_open_ = false;

 public:
   explicit TrackPoseEstimator(KeypointTrack track);

   bool open() noexcept(false) override;
   void close() noexcept override;
   bool is_open() const noexcept override { return is_open_; }

   std::optional<PoseFrame> estimate(int frame_no,
                                     const cv::Mat& im,
                                     int width,
                                     int height) noexcept(false) override;
};

} // namespace formcheck
