#pragma once

#include "edfrec/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace edfrec {

// Data-record durations are expressed in ticks of 10 microseconds.
constexpr int64_t kMicrosecondsPerTick = 10;
constexpr int64_t kTicksPerSecond = 100000;

// Accepted data-record duration range: 0.001 s .. 60 s inclusive.
constexpr int64_t kMinRecordDurationTicks = 100;
constexpr int64_t kMaxRecordDurationTicks = 6000000;

// Convert a duration to 10 us ticks (truncating sub-tick remainders).
int64_t record_duration_ticks(std::chrono::microseconds d);

// True for 1000 .. 60000000 us inclusive, compared before tick conversion.
bool is_valid_record_duration(std::chrono::microseconds d);

// Select the container subtype from the file extension:
//   .edf -> EDF+, .bdf -> BDF+, anything else -> EDF+.
// The comparison is case-insensitive.
FileType file_type_from_path(const std::string& path);

const char* file_type_name(FileType t);

// Sample width and digital range of a container: EDF+ stores 16-bit samples,
// BDF+ 24-bit.
int bytes_per_sample(FileType t);
int digital_limit_min(FileType t);
int digital_limit_max(FileType t);

// Label of the annotation signal(s): "EDF Annotations" / "BDF Annotations".
const char* annotation_signal_label(FileType t);

} // namespace edfrec
