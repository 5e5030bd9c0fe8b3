#pragma once

#include "formcheck/io/struct-meta.hpp"

namespace formcheck
{
// -------------------------------------------------------------- AnalysisParams
//
struct AnalysisParams final : public MetaCompatible
{
   virtual ~AnalysisParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   int frame_stride         = 3;    // process every nth frame
   int max_frames           = 600;  // stop after this many sampled frames
   int min_usable_frames    = 3;    // frames with the primary metric
   int default_frame_width  = 1920; // when the source cannot say
   int default_frame_height = 1080;
   bool emit_summary        = true;

   // Throws std::runtime_error describing the first invalid field
   void validate() const noexcept(false);
};

META_READ_WRITE_LOAD_SAVE(AnalysisParams)

} // namespace formcheck
