#pragma once

#include "edfrec/types.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace edfrec {

enum class RepairKind {
  // The frame's channel count differed from the previous accepted frame; the
  // whole frame was replaced.
  kFrameReplaced,
  // A channel contained NaN; that channel was replaced.
  kChannelReplaced,
  // A channel's sample count differed from its sample frequency. Nothing was
  // changed; the write is still attempted.
  kSampleCountMismatch,
};

const char* repair_kind_name(RepairKind k);

// Non-fatal event reported by the frame pipeline.
struct RepairEvent {
  RepairKind kind{RepairKind::kFrameReplaced};
  long long frame{-1};  // index within the batch
  int channel{-1};      // -1 for whole-frame events
  std::string message;
};

using WarningHandler = std::function<void(const RepairEvent&)>;

// Writer-level settings applied after the per-channel header fields.
struct WriterOptions {
  // Duration of one data record. Must lie in [1 ms, 60 s].
  std::chrono::microseconds record_duration{std::chrono::seconds(1)};

  // Number of annotation signals per data record (1..64). Each one holds one
  // annotation per record.
  int annotation_signals{1};

  AnnotationPosition annotation_position{AnnotationPosition::kEnd};

  // Free text appended to the recording identification field.
  std::string recording_additional;

  // 0 = unlimited. Otherwise a frame that would be the (N+1)-th repaired
  // frame in a row raises RepairLimitError.
  int max_consecutive_repairs{0};

  // Receives repair/mismatch events. Empty = print "Warning: ..." to stderr.
  WarningHandler warning_handler;
};

} // namespace edfrec
