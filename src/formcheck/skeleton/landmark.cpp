#include "landmark.hpp"

#include "formcheck/io/json-io.hpp"
#include "formcheck/utils/string-utils.hpp"

#define This PoseFrame

namespace formcheck
{
// -------------------------------------------------------------- landmark names
//
LandmarkName int_to_landmark_name(int val) noexcept(false)
{
   const auto r = LandmarkName(val);
   switch(r) {
#define E(x) \
   case LandmarkName::x: return LandmarkName::x;
      E(L_SHOULDER);
      E(R_SHOULDER);
      E(L_ELBOW);
      E(R_ELBOW);
      E(L_WRIST);
      E(R_WRIST);
      E(L_HIP);
      E(R_HIP);
      E(L_KNEE);
      E(R_KNEE);
      E(L_ANKLE);
      E(R_ANKLE);
      E(L_TOE);
      E(R_TOE);
      E(L_EAR);
      E(R_EAR);
#undef E
   default: break;
   }
   throw std::runtime_error(
       format("could not convert integer '{}' to a LandmarkName", val));
}

const char* str(const LandmarkName r) noexcept
{
   switch(r) {
#define E(x) \
   case LandmarkName::x: return #x;
      E(L_SHOULDER);
      E(R_SHOULDER);
      E(L_ELBOW);
      E(R_ELBOW);
      E(L_WRIST);
      E(R_WRIST);
      E(L_HIP);
      E(R_HIP);
      E(L_KNEE);
      E(R_KNEE);
      E(L_ANKLE);
      E(R_ANKLE);
      E(L_TOE);
      E(R_TOE);
      E(L_EAR);
      E(R_EAR);
#undef E
   }
   return "<unknown>";
}

LandmarkName to_landmark_name(const string_view s) noexcept(false)
{
   const string val = string_to_uppercase(trim_copy(s));
#define E(x) \
   if(val == #x) return LandmarkName::x;
   E(L_SHOULDER);
   E(R_SHOULDER);
   E(L_ELBOW);
   E(R_ELBOW);
   E(L_WRIST);
   E(R_WRIST);
   E(L_HIP);
   E(R_HIP);
   E(L_KNEE);
   E(R_KNEE);
   E(L_ANKLE);
   E(R_ANKLE);
   E(L_TOE);
   E(R_TOE);
   E(L_EAR);
   E(R_EAR);
#undef E
   throw std::runtime_error(
       format("could not convert '{}' to a LandmarkName", s));
}

// ------------------------------------------------------------------- PoseFrame
//
This::This(int frame_no, int width, int height) noexcept
    : frame_no_(frame_no)
    , width_(width)
    , height_(height)
{}

This& This::set(LandmarkName name, const Landmark& lm) noexcept
{
   Expects(int(name) >= 0 and int(name) < k_n_landmarks);
   landmarks_[size_t(name)] = lm;
   return *this;
}

This This::resized(int frame_no, int width, int height) const noexcept
{
   PoseFrame o = *this;
   o.frame_no_ = frame_no;
   o.width_    = width;
   o.height_   = height;
   return o;
}

bool This::has(LandmarkName name) const noexcept
{
   return landmarks_[size_t(name)].has_value();
}

const std::optional<Landmark>& This::operator[](LandmarkName name) const
    noexcept
{
   return landmarks_[size_t(name)];
}

std::optional<Vector2> This::pixel(LandmarkName name) const noexcept
{
   const auto& lm = landmarks_[size_t(name)];
   if(!lm.has_value() or !lm->is_finite()) return std::nullopt;
   return Vector2{lm->xy.x * real(width_), lm->xy.y * real(height_)};
}

real This::visibility(LandmarkName name) const noexcept
{
   const auto& lm = landmarks_[size_t(name)];
   return lm.has_value() ? lm->visibility : 0.0;
}

real This::overall_visibility() const noexcept
{
   auto present = landmarks_ | views::filter([](const auto& lm) {
                     return lm.has_value();
                  })
                  | views::transform([](const auto& lm) {
                       return lm->visibility;
                    });
   const auto n = ranges::distance(present);
   if(n == 0) return 0.0;
   return ranges::accumulate(present, 0.0) / real(n);
}

size_t This::n_landmarks() const noexcept
{
   return size_t(ranges::count_if(
       landmarks_, [](const auto& lm) { return lm.has_value(); }));
}

Json::Value This::landmarks_to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   for(int i = 0; i < k_n_landmarks; ++i) {
      const auto& lm = landmarks_[size_t(i)];
      if(!lm.has_value()) continue;
      Json::Value a{Json::arrayValue};
      a.append(json_save(lm->xy.x));
      a.append(json_save(lm->xy.y));
      a.append(lm->visibility);
      o[str(LandmarkName(i))] = a;
   }
   return o;
}

// --------------------------------------------------------- landmarks-from-json
//
PoseFrame landmarks_from_json(const Json::Value& o,
                              int frame_no,
                              int width,
                              int height) noexcept(false)
{
   if(!o.isObject())
      throw std::runtime_error(
          format("frame {}: expected an object of landmarks", frame_no));

   PoseFrame frame{frame_no, width, height};
   for(const auto& key : o.getMemberNames()) {
      const auto name  = to_landmark_name(key);
      const auto& node = o[key];
      if(!node.isArray() or node.size() < 2 or node.size() > 3)
         throw std::runtime_error(
             format("frame {}: landmark '{}' must be [x, y] or [x, y, "
                    "visibility]",
                    frame_no,
                    key));
      Landmark lm;
      lm.xy.x       = load_numeric(node[0]);
      lm.xy.y       = load_numeric(node[1]);
      lm.visibility = (node.size() == 3) ? load_numeric(node[2]) : 1.0;
      if(!std::isfinite(lm.visibility)) lm.visibility = 0.0;
      frame.set(name, lm);
   }
   return frame;
}

} // namespace formcheck

#undef This
