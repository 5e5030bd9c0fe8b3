#pragma once

#include "analysis-params.hpp"

#include "formcheck/io/struct-meta.hpp"

namespace formcheck::pipeline
{
struct CliArgs final : public MetaCompatible
{
   virtual ~CliArgs() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   string version{k_version};
   bool show_help{false};
   bool has_error{false};

   string exercise{""s};
   string keypoints_fname{""s}; // recorded landmark track
   string video_fname{""s};     // optional; decoded alongside the track
   string params_fname{""s};
   string output_fname{""s}; // empty means stdout

   // Command-line overrides; 0 means "use the params file or default"
   int frame_stride{0};
   int max_frames{0};
   int min_usable_frames{0};
   bool no_summary{false};

   // Resolved from `params_fname` and the overrides above
   AnalysisParams params;
};

void show_help(string argv0) noexcept;

CliArgs parse_command_line(int argc, char** argv) noexcept;

} // namespace formcheck::pipeline
