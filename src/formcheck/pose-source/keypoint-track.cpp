#include "keypoint-track.hpp"

#include "formcheck/io/json-io.hpp"
#include "formcheck/utils/file-system.hpp"

namespace formcheck
{
// --------------------------------------------------------------- KeypointTrack
//
const KeypointTrack::Entry* KeypointTrack::find(int frame_no) const noexcept
{
   auto ii = ranges::find_if(
       frames, [frame_no](const auto& e) { return e.frame_no == frame_no; });
   return (ii == cend(frames)) ? nullptr : &*ii;
}

Json::Value KeypointTrack::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["width"]  = width;
   o["height"] = height;

   Json::Value ff{Json::arrayValue};
   for(const auto& e : frames) {
      Json::Value x{Json::objectValue};
      x["frame"]     = e.frame_no;
      x["landmarks"] = e.pose.has_value() ? e.pose->landmarks_to_json()
                                          : Json::Value{Json::nullValue};
      ff.append(x);
   }
   o["frames"] = ff;
   return o;
}

string KeypointTrack::to_string() const noexcept
{
   return json_pretty_str(to_json());
}

KeypointTrack read_keypoint_track(const Json::Value& o) noexcept(false)
{
   if(!o.isObject())
      throw std::runtime_error("keypoint track: expected a json object");

   KeypointTrack track;
   if(has_key(o, "width")) json_load(get_key(o, "width"), track.width);
   if(has_key(o, "height")) json_load(get_key(o, "height"), track.height);
   if(track.width < 0 or track.height < 0)
      throw std::runtime_error(format("keypoint track: invalid frame size {}x{}",
                                      track.width,
                                      track.height));

   const auto ff = get_key(o, "frames");
   if(!ff.isArray())
      throw std::runtime_error("keypoint track: 'frames' must be an array");

   track.frames.reserve(ff.size());
   for(auto i = 0u; i < ff.size(); ++i) {
      const auto& node = ff[i];
      if(!node.isObject())
         throw std::runtime_error(
             format("keypoint track: frame #{} must be an object", i));

      KeypointTrack::Entry e;
      e.frame_no = int(i) + 1;
      if(has_key(node, "frame")) json_load(get_key(node, "frame"), e.frame_no);

      if(has_key(node, "landmarks") and !node["landmarks"].isNull())
         e.pose = landmarks_from_json(
             node["landmarks"], e.frame_no, track.width, track.height);

      track.frames.push_back(std::move(e));
   }

   return track;
}

KeypointTrack load_keypoint_track(const string_view fname) noexcept(false)
{
   const auto raw = file_get_contents(fname);
   try {
      return read_keypoint_track(parse_json(raw));
   } catch(std::exception& e) {
      throw std::runtime_error(
          format("failed to load keypoint track '{}': {}", fname, e.what()));
   }
}

// --------------------------------------------------------- KeypointTrackSource
//
KeypointTrackSource::KeypointTrackSource(const string_view fname)
    : fname_(fname)
{}

KeypointTrackSource::KeypointTrackSource(KeypointTrack track)
    : track_(std::move(track))
{}

bool KeypointTrackSource::open() noexcept(false)
{
   close();
   if(!fname_.empty()) {
      if(!is_regular_file(fname_)) {
         WARN(format("keypoint track '{}' not found", fname_));
         return false;
      }
      track_ = load_keypoint_track(fname_);
   }
   is_open_ = true;
   return true;
}

void KeypointTrackSource::close() noexcept
{
   is_open_  = false;
   position_ = 0;
}

bool KeypointTrackSource::advance() noexcept(false)
{
   if(!is_open_ or position_ >= track_.frames.size()) return false;
   ++position_;
   return true;
}

int KeypointTrackSource::frame_no() const noexcept
{
   return (position_ == 0) ? 0 : track_.frames[position_ - 1].frame_no;
}

std::optional<PoseFrame> KeypointTrackSource::detect(int width,
                                                     int height) noexcept(false)
{
   Expects(is_open_ and position_ > 0);
   const auto& e = track_.frames[position_ - 1];
   if(!e.pose.has_value()) return std::nullopt;
   return e.pose->resized(e.frame_no, width, height);
}

// ---------------------------------------------------------- TrackPoseEstimator
//
TrackPoseEstimator::TrackPoseEstimator(KeypointTrack track)
    : track_(std::move(track))
{}

bool TrackPoseEstimator::open() noexcept(false)
{
   is_open_ = true;
   return true;
}

void TrackPoseEstimator::close() noexcept { is_open_ = false; }

std::optional<PoseFrame> TrackPoseEstimator::estimate(int frame_no,
                                                      const cv::Mat&,
                                                      int width,
                                                      int height) noexcept(false)
{
   if(!is_open_)
      throw std::runtime_error("pose estimator used before it was opened");
   const auto e = track_.find(frame_no);
   if(e == nullptr or !e->pose.has_value()) return std::nullopt;
   return e->pose->resized(frame_no, width, height);
}

} // namespace formcheck
