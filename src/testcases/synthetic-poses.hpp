#pragma once

#include "formcheck/pose-source/pose-frame-source.hpp"
#include "formcheck/skeleton/landmark.hpp"
#include "formcheck/utils/math.hpp"

// Synthetic landmark sets for the testcases. All frames are 1000x1000, so
// one normalized unit is 1000 pixels on both axes.
namespace formcheck::testing
{
constexpr int k_size = 1000;

inline Landmark make_landmark(real x, real y, real visibility = 1.0)
{
   Landmark lm;
   lm.xy         = Vector2{x, y};
   lm.visibility = visibility;
   return lm;
}

// Side view of a squat on the left side with knee angle `alpha` (degrees).
// The shoulder is directly above the hip, the toe points forward along the
// floor, and the knee sits 0.2 above the ankle-toe line.
inline PoseFrame make_squat_frame(int frame_no, real alpha)
{
   const Vector2 knee{0.5, 0.5};
   const Vector2 ankle{0.5, 0.7};
   const real theta = to_radians(alpha);
   const Vector2 hip
       = knee + Vector2{0.2 * std::sin(theta), 0.2 * std::cos(theta)};
   const Vector2 shoulder = hip + Vector2{0.0, -0.25};
   const Vector2 toe      = ankle + Vector2{0.05, 0.0};

   PoseFrame f{frame_no, k_size, k_size};
   f.set(L_HIP, make_landmark(hip.x, hip.y));
   f.set(L_KNEE, make_landmark(knee.x, knee.y));
   f.set(L_ANKLE, make_landmark(ankle.x, ankle.y));
   f.set(L_SHOULDER, make_landmark(shoulder.x, shoulder.y));
   f.set(L_TOE, make_landmark(toe.x, toe.y));
   return f;
}

// 30 knee angles: 12 descending from 170, 6 at the bottom (90), and 12
// ascending back to 170.
inline vector<real> squat_rep_angles()
{
   vector<real> out;
   for(int i = 0; i < 12; ++i) out.push_back(170.0 - 80.0 * i / 12.0);
   for(int i = 0; i < 6; ++i) out.push_back(90.0);
   for(int i = 1; i <= 12; ++i) out.push_back(90.0 + 80.0 * i / 12.0);
   return out;
}

// Push-up seen from the left, at elbow angle `alpha` (degrees). The wrist is
// 0.06 forward of the shoulder, and the left side is more visible.
inline PoseFrame make_pushup_frame(int frame_no, real alpha)
{
   const Vector2 shoulder{0.3, 0.4};
   const Vector2 elbow = shoulder + Vector2{0.0, 0.1};
   // Wrist lies on the vertical line x = 0.36, at the requested elbow angle
   const real theta   = to_radians(180.0 - alpha);
   const real dy      = 0.06 / std::tan(theta);
   const Vector2 wrist = Vector2{0.36, elbow.y + dy};
   const Vector2 hip{0.6, 0.42};
   const Vector2 ankle{0.9, 0.44};
   const Vector2 ear{0.25, 0.4};

   PoseFrame f{frame_no, k_size, k_size};
   f.set(L_SHOULDER, make_landmark(shoulder.x, shoulder.y, 0.9));
   f.set(L_ELBOW, make_landmark(elbow.x, elbow.y, 0.9));
   f.set(L_WRIST, make_landmark(wrist.x, wrist.y, 0.9));
   f.set(L_HIP, make_landmark(hip.x, hip.y, 0.9));
   f.set(L_ANKLE, make_landmark(ankle.x, ankle.y, 0.9));
   f.set(L_EAR, make_landmark(ear.x, ear.y, 0.9));
   // The far side: a different (wrong) arm, less visible
   f.set(R_SHOULDER, make_landmark(0.3, 0.4, 0.2));
   f.set(R_ELBOW, make_landmark(0.3, 0.5, 0.2));
   f.set(R_WRIST, make_landmark(0.7, 0.6, 0.2));
   return f;
}

// ---------------------------------------------------------- VectorPoseSource
// Replays a list of frames (or non-detections), and records how it was used.
class VectorPoseSource final : public PoseFrameSource
{
 private:
   vector<std::optional<PoseFrame>> frames_;
   int width_       = k_size;
   int height_      = k_size;
   bool is_open_    = false;
   bool fail_open_  = false;
   bool throw_open_ = false; // half-opens, then throws from `open`
   int throw_at_    = 0;     // throw on this `advance`, if positive
   size_t position_ = 0;

 public:
   int n_open_calls    = 0;
   int n_close_calls   = 0;
   int n_advance_calls = 0;
   int n_detect_calls  = 0;

   explicit VectorPoseSource(vector<std::optional<PoseFrame>> frames,
                             bool fail_open  = false,
                             int throw_at    = 0,
                             bool throw_open = false)
       : frames_(std::move(frames))
       , fail_open_(fail_open)
       , throw_open_(throw_open)
       , throw_at_(throw_at)
   {}

   void set_size(int w, int h) noexcept
   {
      width_  = w;
      height_ = h;
   }

   bool open() noexcept(false) override
   {
      ++n_open_calls;
      position_ = 0;
      is_open_  = !fail_open_;
      if(throw_open_) throw std::runtime_error("estimator failed to load");
      return is_open_;
   }
   void close() noexcept override
   {
      ++n_close_calls;
      is_open_ = false;
   }
   bool is_open() const noexcept override { return is_open_; }
   int frame_width() const noexcept override { return width_; }
   int frame_height() const noexcept override { return height_; }

   bool advance() noexcept(false) override
   {
      ++n_advance_calls;
      if(throw_at_ > 0 and n_advance_calls == throw_at_)
         throw std::runtime_error("corrupt frame");
      if(!is_open_ or position_ >= frames_.size()) return false;
      ++position_;
      return true;
   }
   int frame_no() const noexcept override { return int(position_); }

   std::optional<PoseFrame> detect(int w, int h) noexcept(false) override
   {
      ++n_detect_calls;
      const auto& f = frames_[position_ - 1];
      if(!f.has_value()) return std::nullopt;
      return f->resized(int(position_), w, h);
   }
};

} // namespace formcheck::testing
