#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"

#include <opencv2/core/core.hpp>

#include "formcheck/io/json-io.hpp"
#include "formcheck/pose-source/keypoint-track.hpp"
#include "formcheck/pose-source/video-pose-source.hpp"
#include "formcheck/utils/file-system.hpp"

static const bool feedback = false;

namespace formcheck
{
static const char* k_track_json = R"V0G0N(
{
   "width": 640,
   "height": 480,
   "frames": [
      {"frame": 10, "landmarks": {"L_HIP": [0.5, 0.25, 0.9],
                                  "l_knee": [0.5, 0.5]}},
      {"frame": 11, "landmarks": null},
      {"landmarks": {"R_ANKLE": [0.25, 0.75, 0.5]}}
   ]
}
)V0G0N";

CATCH_TEST_CASE("KeypointTrack", "[keypoint-track]")
{
   CATCH_SECTION("read")
   {
      const auto track = read_keypoint_track(parse_json(k_track_json));
      CATCH_REQUIRE(track.width == 640);
      CATCH_REQUIRE(track.height == 480);
      CATCH_REQUIRE(track.size() == 3);

      CATCH_REQUIRE(track.frames[0].frame_no == 10);
      CATCH_REQUIRE(track.frames[0].pose.has_value());
      const auto& f0 = *track.frames[0].pose;
      CATCH_REQUIRE(f0.n_landmarks() == 2);
      CATCH_REQUIRE(f0.visibility(L_HIP) == Approx(0.9));
      CATCH_REQUIRE(f0.pixel(L_HIP)->x == Approx(320.0));
      CATCH_REQUIRE(f0.pixel(L_HIP)->y == Approx(120.0));
      CATCH_REQUIRE(f0.has(L_KNEE));
      CATCH_REQUIRE(!f0.has(R_KNEE));

      CATCH_REQUIRE(track.frames[1].frame_no == 11);
      CATCH_REQUIRE(!track.frames[1].pose.has_value());

      // Defaults to the 1-based position
      CATCH_REQUIRE(track.frames[2].frame_no == 3);
      CATCH_REQUIRE(track.find(3) != nullptr);
      CATCH_REQUIRE(track.find(4) == nullptr);

      // Survives a trip through json
      const auto track2 = read_keypoint_track(track.to_json());
      CATCH_REQUIRE(track2.size() == 3);
      CATCH_REQUIRE(track2.frames[0].frame_no == 10);
      CATCH_REQUIRE(track2.frames[0].pose->pixel(L_HIP)->x == Approx(320.0));
      CATCH_REQUIRE(!track2.frames[1].pose.has_value());

      if(feedback) cout << str(track) << endl;
   }

   CATCH_SECTION("malformed")
   {
      CATCH_REQUIRE_THROWS(read_keypoint_track(parse_json("[1, 2, 3]")));
      CATCH_REQUIRE_THROWS(read_keypoint_track(parse_json(R"({"frames": 7})")));
      CATCH_REQUIRE_THROWS(
          read_keypoint_track(parse_json(R"({"frames": [3]})")));
      CATCH_REQUIRE_THROWS(read_keypoint_track(parse_json(
          R"({"frames": [{"landmarks": {"L_NOSE": [0.1, 0.2]}}]})")));
      CATCH_REQUIRE_THROWS(read_keypoint_track(
          parse_json(R"({"frames": [{"landmarks": {"L_HIP": [0.1]}}]})")));
      CATCH_REQUIRE_THROWS(load_keypoint_track("/tmp/no-such-track.json"));
   }
}

CATCH_TEST_CASE("KeypointTrackSource", "[keypoint-track-source]")
{
   CATCH_SECTION("replay")
   {
      KeypointTrackSource source{read_keypoint_track(parse_json(k_track_json))};
      CATCH_REQUIRE(!source.is_open());
      CATCH_REQUIRE(!source.advance());
      CATCH_REQUIRE(source.open());
      CATCH_REQUIRE(source.frame_width() == 640);
      CATCH_REQUIRE(source.frame_height() == 480);

      CATCH_REQUIRE(source.advance());
      CATCH_REQUIRE(source.frame_no() == 10);
      const auto f = source.detect(1280, 960);
      CATCH_REQUIRE(f.has_value());
      CATCH_REQUIRE(f->frame_no() == 10);
      CATCH_REQUIRE(f->pixel(L_HIP)->x == Approx(640.0));

      CATCH_REQUIRE(source.advance());
      CATCH_REQUIRE(!source.detect(640, 480).has_value());
      CATCH_REQUIRE(source.advance());
      CATCH_REQUIRE(source.frame_no() == 3);
      CATCH_REQUIRE(!source.advance());

      source.close();
      source.close();
      CATCH_REQUIRE(!source.is_open());
   }

   CATCH_SECTION("from-file")
   {
      const string fname = "/tmp/formcheck-keypoint-track.test.json";
      CATCH_REQUIRE(!file_put_contents(fname, k_track_json));
      KeypointTrackSource source{fname};
      CATCH_REQUIRE(source.open());
      auto n_frames = 0;
      while(source.advance()) ++n_frames;
      CATCH_REQUIRE(n_frames == 3);
      source.close();
      delete_file(fname);

      KeypointTrackSource missing{"/tmp/no-such-track.json"};
      CATCH_REQUIRE(!missing.open());
      CATCH_REQUIRE(!missing.is_open());
   }
}

CATCH_TEST_CASE("TrackPoseEstimator", "[track-pose-estimator]")
{
   CATCH_SECTION("estimate")
   {
      TrackPoseEstimator estimator{
          read_keypoint_track(parse_json(k_track_json))};
      const cv::Mat im;
      CATCH_REQUIRE_THROWS(estimator.estimate(10, im, 640, 480));
      CATCH_REQUIRE(estimator.open());
      CATCH_REQUIRE(estimator.estimate(10, im, 640, 480).has_value());
      CATCH_REQUIRE(!estimator.estimate(11, im, 640, 480).has_value());
      CATCH_REQUIRE(!estimator.estimate(99, im, 640, 480).has_value());
      estimator.close();
      CATCH_REQUIRE(!estimator.is_open());
   }

   CATCH_SECTION("missing-video")
   {
      TrackPoseEstimator estimator{KeypointTrack{}};
      VideoPoseSource source{"/tmp/no-such-video.mp4", estimator};
      CATCH_REQUIRE(!source.open());
      CATCH_REQUIRE(!source.is_open());
      CATCH_REQUIRE(!estimator.is_open());
   }
}

} // namespace formcheck
