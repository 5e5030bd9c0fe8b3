#pragma once

#include <initializer_list>

#include "landmark.hpp"

namespace formcheck
{
enum class Side : int8_t { LEFT = 0, RIGHT };

enum class Joint : int8_t {
   SHOULDER = 0,
   ELBOW,
   WRIST,
   HIP,
   KNEE,
   ANKLE,
   TOE,
   EAR
};

const char* str(const Side) noexcept;
const char* str(const Joint) noexcept;

Side to_side(const string_view) noexcept(false);

// The landmark for `joint` on `side`
LandmarkName landmark_of(const Side side, const Joint joint) noexcept;

Side opposite(const Side side) noexcept;

// ----------------------------------------------------------------- Side choice
// Sums the visibility of the group's landmarks on each side, and returns the
// side with the greater sum. Ties go to LEFT. Evaluated afresh for every
// frame; there is no smoothing between frames.

// Hip and knee
Side choose_leg_side(const PoseFrame& frame) noexcept;

// Shoulder, elbow and wrist
Side choose_arm_side(const PoseFrame& frame) noexcept;

Side choose_side(const PoseFrame& frame,
                 std::initializer_list<Joint> group) noexcept;

} // namespace formcheck
