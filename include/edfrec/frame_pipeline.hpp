#pragma once

#include "edfrec/options.hpp"
#include "edfrec/session.hpp"
#include "edfrec/types.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace edfrec {

struct FrameBatchReport {
  size_t frames_written{0};
  // Frames replaced wholesale because their channel count changed.
  size_t frames_replaced{0};
  // Individual channels replaced because they contained NaN.
  size_t channels_replaced{0};
  size_t sample_count_warnings{0};
};

// Validates, repairs and writes frames through a shared Session.
//
// Repair policy, applied per batch in order:
// 1) a frame whose channel count differs from the previous accepted frame is
//    replaced by a copy of that frame
// 2) otherwise every channel containing NaN is replaced by the same channel of
//    the previous accepted frame
// The previous accepted frame starts as a copy of the first frame of the
// batch. Each repair is reported as a RepairEvent; channels whose length
// differs from their sample frequency are reported too but written as-is.
//
// Errors from the session are rethrown with the batch frame index attached.
class FramePipeline {
public:
  FramePipeline(std::shared_ptr<Session> session, int max_consecutive_repairs = 0,
                WarningHandler handler = WarningHandler());

  FrameBatchReport write_frame(const Frame& frame);
  FrameBatchReport write_frames(const std::vector<Frame>& frames);

private:
  void report(const RepairEvent& ev) const;

  std::shared_ptr<Session> session_;
  int max_consecutive_repairs_{0};
  WarningHandler handler_;
};

// Handler used when none is configured: "Warning: <message>" on stderr.
void print_repair_warning(const RepairEvent& ev);

} // namespace edfrec
