#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace edfrec {

// EDF+ Time-stamped Annotation List (TAL) encoding.
//
// A TAL is
//   +<onset>[\x15<duration>]\x14<text>\x14\x00
// with onset/duration in seconds (decimal ASCII). The first TAL of every
// data record is a time-keeping TAL with empty text:
//   +<record onset>\x14\x14\x00

constexpr char kTalOnsetDurationSep = '\x15';
constexpr char kTalTextSep = '\x14';

// Longest annotation text (in UTF-8 bytes) stored in a TAL.
constexpr size_t kMaxAnnotationTextBytes = 40;

// Format microseconds as a signed decimal seconds value without trailing
// zeros: 1500000 -> "+1.5", -250000 -> "-0.25", 0 -> "+0".
std::string format_tal_onset(int64_t onset_us);

// Same as format_tal_onset() without the forced '+'. Negative durations
// return an empty string (duration omitted).
std::string format_tal_duration(int64_t duration_us);

// Make UTF-8 text safe for a TAL: control characters and the TAL delimiters
// become spaces, invalid UTF-8 bytes become '?', leading/trailing whitespace
// is trimmed and the result is cut to at most max_bytes without splitting a
// multi-byte sequence.
std::string sanitize_tal_text(const std::string& utf8, size_t max_bytes = kMaxAnnotationTextBytes);

// Complete TAL for one annotation (text already sanitized).
std::string build_tal_entry(int64_t onset_us, int64_t duration_us, const std::string& text);

// Time-keeping TAL for a data record starting at record_onset_us.
std::string build_tal_timekeeping(int64_t record_onset_us);

} // namespace edfrec
