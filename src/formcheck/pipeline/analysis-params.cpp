#include "analysis-params.hpp"

#define This AnalysisParams

namespace formcheck
{
const vector<MemberMetaData>& This::meta_data() const noexcept
{
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(This, INT, frame_stride, true));
      m.push_back(MAKE_META(This, INT, max_frames, true));
      m.push_back(MAKE_META(This, INT, min_usable_frames, true));
      m.push_back(MAKE_META(This, INT, default_frame_width, true));
      m.push_back(MAKE_META(This, INT, default_frame_height, true));
      m.push_back(MAKE_META(This, BOOL, emit_summary, true));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

void This::validate() const noexcept(false)
{
   auto check_positive = [](const char* name, int value) {
      if(value < 1)
         throw std::runtime_error(
             format("'{}' must be at least 1, but got {}", name, value));
   };
   check_positive("frame_stride", frame_stride);
   check_positive("max_frames", max_frames);
   check_positive("min_usable_frames", min_usable_frames);
   check_positive("default_frame_width", default_frame_width);
   check_positive("default_frame_height", default_frame_height);
}

} // namespace formcheck

#undef This
