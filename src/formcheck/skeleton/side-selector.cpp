#include "side-selector.hpp"

#include "formcheck/utils/string-utils.hpp"

namespace formcheck
{
// ------------------------------------------------------------------------- str
//
const char* str(const Side x) noexcept
{
   switch(x) {
   case Side::LEFT: return "left";
   case Side::RIGHT: return "right";
   }
   return "<unknown>";
}

const char* str(const Joint x) noexcept
{
   switch(x) {
#define E(x) \
   case Joint::x: return #x;
      E(SHOULDER);
      E(ELBOW);
      E(WRIST);
      E(HIP);
      E(KNEE);
      E(ANKLE);
      E(TOE);
      E(EAR);
#undef E
   }
   return "<unknown>";
}

Side to_side(const string_view s) noexcept(false)
{
   const auto val = string_to_lowercase(trim_copy(s));
   if(val == "left") return Side::LEFT;
   if(val == "right") return Side::RIGHT;
   throw std::runtime_error(format("could not convert '{}' to a Side", s));
}

// ----------------------------------------------------------------- landmark-of
//
LandmarkName landmark_of(const Side side, const Joint joint) noexcept
{
   const bool l = (side == Side::LEFT);
   switch(joint) {
   case Joint::SHOULDER: return l ? L_SHOULDER : R_SHOULDER;
   case Joint::ELBOW: return l ? L_ELBOW : R_ELBOW;
   case Joint::WRIST: return l ? L_WRIST : R_WRIST;
   case Joint::HIP: return l ? L_HIP : R_HIP;
   case Joint::KNEE: return l ? L_KNEE : R_KNEE;
   case Joint::ANKLE: return l ? L_ANKLE : R_ANKLE;
   case Joint::TOE: return l ? L_TOE : R_TOE;
   case Joint::EAR: return l ? L_EAR : R_EAR;
   }
   FATAL("kBAM!");
   return L_SHOULDER;
}

Side opposite(const Side side) noexcept
{
   return (side == Side::LEFT) ? Side::RIGHT : Side::LEFT;
}

// ----------------------------------------------------------------- choose-side
//
Side choose_side(const PoseFrame& frame,
                 std::initializer_list<Joint> group) noexcept
{
   auto sum_visibility = [&](Side side) {
      real sum = 0.0;
      for(const auto joint : group)
         sum += frame.visibility(landmark_of(side, joint));
      return sum;
   };
   return (sum_visibility(Side::LEFT) >= sum_visibility(Side::RIGHT))
              ? Side::LEFT
              : Side::RIGHT;
}

Side choose_leg_side(const PoseFrame& frame) noexcept
{
   return choose_side(frame, {Joint::HIP, Joint::KNEE});
}

Side choose_arm_side(const PoseFrame& frame) noexcept
{
   return choose_side(frame, {Joint::SHOULDER, Joint::ELBOW, Joint::WRIST});
}

} // namespace formcheck
