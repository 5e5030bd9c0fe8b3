#pragma once

#include "formcheck/skeleton/landmark.hpp"

namespace formcheck
{
// ------------------------------------------------------------- PoseFrameSource
// A lazy, finite, non-restartable sequence of frames, each of which may or
// may not have a detected pose. Frames are numbered from 1.
class PoseFrameSource
{
 public:
   virtual ~PoseFrameSource() = default;

   // FALSE if the underlying media cannot be opened or decoded.
   virtual bool open() noexcept(false) = 0;

   // Releases every resource. Safe to call more than once, and safe to call
   // after a failed `open`.
   virtual void close() noexcept = 0;

   virtual bool is_open() const noexcept = 0;

   // 0 if unknown
   virtual int frame_width() const noexcept  = 0;
   virtual int frame_height() const noexcept = 0;

   // Moves to the next frame. FALSE at the end of the sequence.
   virtual bool advance() noexcept(false) = 0;

   // Number of the current frame; 0 before the first `advance`.
   virtual int frame_no() const noexcept = 0;

   // The pose on the current frame, with pixel positions taken in a
   // `width`x`height` image. nullopt if nothing was detected.
   virtual std::optional<PoseFrame> detect(int width, int height) noexcept(false)
       = 0;
};

// ----------------------------------------------------------------- PoseSession
// Opens a source on construction, and closes it on destruction, whether or
// not the open succeeded. A throwing `open` closes the source before the
// exception leaves the constructor.
class PoseSession
{
 private:
   PoseFrameSource& source_;
   bool is_open_ = false;

 public:
   explicit PoseSession(PoseFrameSource& source) noexcept(false)
       : source_(source)
   {
      try {
         is_open_ = source_.open();
      } catch(...) {
         source_.close();
         throw;
      }
   }
   PoseSession(const PoseSession&) = delete;
   PoseSession(PoseSession&&)      = delete;
   ~PoseSession() { source_.close(); }
   PoseSession& operator=(const PoseSession&) = delete;
   PoseSession& operator=(PoseSession&&) = delete;

   bool is_open() const noexcept { return is_open_; }
};

} // namespace formcheck
