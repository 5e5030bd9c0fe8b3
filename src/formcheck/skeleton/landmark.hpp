#pragma once

#include "formcheck/geometry/vector-2.hpp"

namespace Json
{
class Value;
}

namespace formcheck
{
// -------------------------------------------------------------- landmark names
//
enum LandmarkName : int8_t {
   L_SHOULDER = 0,
   R_SHOULDER, // 1
   L_ELBOW,    // 2
   R_ELBOW,    // 3
   L_WRIST,    // 4
   R_WRIST,    // 5
   L_HIP,      // 6
   R_HIP,      // 7
   L_KNEE,     // 8
   R_KNEE,     // 9
   L_ANKLE,    // 10
   R_ANKLE,    // 11
   L_TOE,      // 12, the foot index
   R_TOE,      // 13
   L_EAR,      // 14
   R_EAR       // 15
};

constexpr int k_n_landmarks = int(LandmarkName::R_EAR) + 1;

LandmarkName int_to_landmark_name(int) noexcept(false);
const char* str(const LandmarkName) noexcept;
LandmarkName to_landmark_name(const string_view val) noexcept(false);

// -------------------------------------------------------------------- Landmark
// Normalized [0..1] image coordinates, y grows downward.
struct Landmark
{
   Vector2 xy      = Vector2::nan();
   real visibility = 0.0;

   bool is_finite() const noexcept { return xy.is_finite(); }
};

// ------------------------------------------------------------------- PoseFrame
// One detected pose. Immutable once built by a pose source.
struct PoseFrame
{
 private:
   int frame_no_ = 0;
   int width_    = 0;
   int height_   = 0;
   array<std::optional<Landmark>, k_n_landmarks> landmarks_;

 public:
   PoseFrame() = default;
   PoseFrame(int frame_no, int width, int height) noexcept;

   // Used while building a frame
   PoseFrame& set(LandmarkName name, const Landmark& lm) noexcept;

   // The same landmarks, renumbered and placed in a `width`x`height` image
   PoseFrame resized(int frame_no, int width, int height) const noexcept;

   int frame_no() const noexcept { return frame_no_; }
   int width() const noexcept { return width_; }
   int height() const noexcept { return height_; }

   bool has(LandmarkName name) const noexcept;
   const std::optional<Landmark>& operator[](LandmarkName name) const noexcept;

   // Pixel position of a landmark, nullopt if absent
   std::optional<Vector2> pixel(LandmarkName name) const noexcept;

   // 0.0 if the landmark is absent
   real visibility(LandmarkName name) const noexcept;

   // Mean visibility of the present landmarks; 0.0 if there are none
   real overall_visibility() const noexcept;

   size_t n_landmarks() const noexcept;

   // {"L_HIP": [x, y, visibility], ...}
   Json::Value landmarks_to_json() const noexcept;
};

// Throws std::runtime_error on a malformed landmark object
PoseFrame landmarks_from_json(const Json::Value& o,
                              int frame_no,
                              int width,
                              int height) noexcept(false);

} // namespace formcheck
