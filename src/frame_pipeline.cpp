#include "edfrec/frame_pipeline.hpp"

#include "edfrec/errors.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace edfrec {

namespace {

bool contains_nan(const std::vector<double>& v) {
  for (double x : v) {
    if (std::isnan(x)) return true;
  }
  return false;
}

} // namespace

const char* repair_kind_name(RepairKind k) {
  switch (k) {
    case RepairKind::kFrameReplaced:
      return "frame_replaced";
    case RepairKind::kChannelReplaced:
      return "channel_replaced";
    case RepairKind::kSampleCountMismatch:
      return "sample_count_mismatch";
  }
  return "unknown";
}

void print_repair_warning(const RepairEvent& ev) {
  std::cerr << "Warning: " << ev.message << "\n";
}

FramePipeline::FramePipeline(std::shared_ptr<Session> session, int max_consecutive_repairs,
                             WarningHandler handler)
    : session_(std::move(session)),
      max_consecutive_repairs_(max_consecutive_repairs),
      handler_(std::move(handler)) {
  if (!session_) throw std::invalid_argument("FramePipeline: session is null");
}

void FramePipeline::report(const RepairEvent& ev) const {
  if (handler_) {
    handler_(ev);
  } else {
    print_repair_warning(ev);
  }
}

FrameBatchReport FramePipeline::write_frame(const Frame& frame) {
  return write_frames(std::vector<Frame>{frame});
}

FrameBatchReport FramePipeline::write_frames(const std::vector<Frame>& frames) {
  FrameBatchReport out;
  if (frames.empty()) return out;

  const Header header = session_->header();
  Frame previous = frames.front();
  int consecutive_repairs = 0;

  for (size_t fi = 0; fi < frames.size(); ++fi) {
    const long long idx = static_cast<long long>(fi);
    Frame frame = frames[fi];
    bool repaired = false;

    if (frame.size() != previous.size()) {
      RepairEvent ev;
      ev.kind = RepairKind::kFrameReplaced;
      ev.frame = idx;
      ev.message = "frame " + std::to_string(fi) + " has " + std::to_string(frame.size()) +
                   " channels, expected " + std::to_string(previous.size()) +
                   "; replaced by the previous frame";
      report(ev);
      frame = previous;
      ++out.frames_replaced;
      repaired = true;
    } else {
      for (size_t ch = 0; ch < frame.size(); ++ch) {
        if (!contains_nan(frame[ch])) continue;
        RepairEvent ev;
        ev.kind = RepairKind::kChannelReplaced;
        ev.frame = idx;
        ev.channel = static_cast<int>(ch);
        ev.message = "frame " + std::to_string(fi) + " channel " + std::to_string(ch) +
                     " contains NaN; replaced by the previous frame's samples";
        report(ev);
        frame[ch] = previous[ch];
        ++out.channels_replaced;
        repaired = true;
      }
    }

    if (repaired) {
      ++consecutive_repairs;
      if (max_consecutive_repairs_ > 0 && consecutive_repairs > max_consecutive_repairs_) {
        throw RepairLimitError("more than " + std::to_string(max_consecutive_repairs_) +
                                   " consecutive frames needed repair",
                               idx);
      }
    } else {
      consecutive_repairs = 0;
    }

    for (size_t ch = 0; ch < frame.size() && ch < header.channels.size(); ++ch) {
      const size_t expected = static_cast<size_t>(header.channels[ch].sample_frequency);
      if (frame[ch].size() == expected) continue;
      RepairEvent ev;
      ev.kind = RepairKind::kSampleCountMismatch;
      ev.frame = idx;
      ev.channel = static_cast<int>(ch);
      ev.message = "frame " + std::to_string(fi) + " channel " + std::to_string(ch) + " has " +
                   std::to_string(frame[ch].size()) + " samples, sample frequency is " +
                   std::to_string(expected);
      report(ev);
      ++out.sample_count_warnings;
    }

    try {
      session_->write_frame(frame);
    } catch (WriterError& e) {
      e.set_frame(idx);
      throw;
    }

    ++out.frames_written;
    previous = std::move(frame);
  }

  return out;
}

} // namespace edfrec
