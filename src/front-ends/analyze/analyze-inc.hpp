#pragma once

namespace formcheck::analyze
{
inline string brief() noexcept
{
   return "scores squat, push-up and lunge form from a landmark track.";
}

int run_main(int argc, char** argv);
} // namespace formcheck::analyze
