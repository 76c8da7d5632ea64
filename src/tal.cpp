#include "edfrec/tal.hpp"

#include "edfrec/utils.hpp"

#include <cstdint>
#include <string>

namespace edfrec {

static std::string format_tal_number(int64_t us, bool force_plus) {
  const bool negative = us < 0;
  // Avoid overflow on INT64_MIN by working in unsigned arithmetic.
  const uint64_t mag = negative ? (static_cast<uint64_t>(-(us + 1)) + 1u) : static_cast<uint64_t>(us);
  const uint64_t whole = mag / 1000000u;
  uint64_t frac = mag % 1000000u;

  std::string s;
  if (negative) {
    s.push_back('-');
  } else if (force_plus) {
    s.push_back('+');
  }
  s += std::to_string(whole);

  if (frac != 0) {
    std::string digits = std::to_string(frac);
    digits.insert(digits.begin(), 6 - digits.size(), '0');
    // Strip trailing zeros.
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    s.push_back('.');
    s += digits;
  }
  return s;
}

std::string format_tal_onset(int64_t onset_us) {
  return format_tal_number(onset_us, /*force_plus=*/true);
}

std::string format_tal_duration(int64_t duration_us) {
  if (duration_us < 0) return std::string();
  return format_tal_number(duration_us, /*force_plus=*/false);
}

// Length of the UTF-8 sequence introduced by lead byte `b`, or 0 if `b` is not
// a valid lead byte.
static size_t utf8_sequence_length(unsigned char b) {
  if (b < 0x80) return 1;
  if ((b & 0xE0) == 0xC0 && b >= 0xC2) return 2;
  if ((b & 0xF0) == 0xE0) return 3;
  if ((b & 0xF8) == 0xF0 && b <= 0xF4) return 4;
  return 0;
}

std::string sanitize_tal_text(const std::string& utf8, size_t max_bytes) {
  std::string out;
  out.reserve(utf8.size());

  size_t i = 0;
  while (i < utf8.size()) {
    const unsigned char uc = static_cast<unsigned char>(utf8[i]);
    if (uc < 0x20 || uc == 0x7F) {
      // Control characters, including 0x00/0x14/0x15.
      out.push_back(' ');
      ++i;
      continue;
    }
    const size_t n = utf8_sequence_length(uc);
    bool valid = n > 0 && i + n <= utf8.size();
    for (size_t k = 1; valid && k < n; ++k) {
      const unsigned char cont = static_cast<unsigned char>(utf8[i + k]);
      if ((cont & 0xC0) != 0x80) valid = false;
    }
    if (!valid) {
      out.push_back('?');
      ++i;
      continue;
    }
    out.append(utf8, i, n);
    i += n;
  }

  out = trim(out);

  if (out.size() > max_bytes) {
    size_t cut = max_bytes;
    // Back up to the start of a UTF-8 sequence.
    while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) --cut;
    out.resize(cut);
    out = trim(out);
  }
  return out;
}

std::string build_tal_entry(int64_t onset_us, int64_t duration_us, const std::string& text) {
  std::string tal = format_tal_onset(onset_us);
  const std::string dur = format_tal_duration(duration_us);
  if (!dur.empty()) {
    tal.push_back(kTalOnsetDurationSep);
    tal += dur;
  }
  tal.push_back(kTalTextSep);
  tal += text;
  tal.push_back(kTalTextSep);
  tal.push_back('\0');
  return tal;
}

std::string build_tal_timekeeping(int64_t record_onset_us) {
  std::string tal = format_tal_onset(record_onset_us);
  tal.push_back(kTalTextSep);
  tal.push_back(kTalTextSep);
  tal.push_back('\0');
  return tal;
}

} // namespace edfrec
