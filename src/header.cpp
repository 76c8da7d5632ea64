#include "edfrec/header.hpp"

#include "edfrec/utils.hpp"

#include <string>

namespace edfrec {

int64_t record_duration_ticks(std::chrono::microseconds d) {
  return static_cast<int64_t>(d.count()) / kMicrosecondsPerTick;
}

bool is_valid_record_duration(std::chrono::microseconds d) {
  const int64_t us = static_cast<int64_t>(d.count());
  return us >= kMinRecordDurationTicks * kMicrosecondsPerTick &&
         us <= kMaxRecordDurationTicks * kMicrosecondsPerTick;
}

FileType file_type_from_path(const std::string& path) {
  if (ends_with(to_lower(path), ".bdf")) return FileType::kBdfPlus;
  return FileType::kEdfPlus;
}

const char* file_type_name(FileType t) {
  switch (t) {
    case FileType::kEdfPlus: return "EDF+";
    case FileType::kBdfPlus: return "BDF+";
  }
  return "EDF+";
}

int bytes_per_sample(FileType t) {
  return t == FileType::kBdfPlus ? 3 : 2;
}

int digital_limit_min(FileType t) {
  return t == FileType::kBdfPlus ? -8388608 : -32768;
}

int digital_limit_max(FileType t) {
  return t == FileType::kBdfPlus ? 8388607 : 32767;
}

const char* annotation_signal_label(FileType t) {
  return t == FileType::kBdfPlus ? "BDF Annotations" : "EDF Annotations";
}

} // namespace edfrec
