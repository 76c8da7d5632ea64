#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace edfrec {

enum class Sex {
  kFemale = 0,
  kMale = 1,
};

// Patient / administrative identification embedded once per recording.
//
// All text fields are UTF-8 on the C++ side; they are converted to Latin-1
// when handed to the codec engine and to printable ASCII in the file header.
struct PatientInfo {
  std::string name;
  std::string code;
  Sex sex{Sex::kFemale};
  std::string admin_code;
  std::string technician;
  std::string equipment;
};

// Per-channel calibration and identification.
//
// sample_frequency is the number of samples in one data record (one second
// with the default record duration).
struct Channel {
  std::string label;
  std::string transducer;
  int digital_max{32767};
  int digital_min{-32768};
  double physical_max{0.0};
  double physical_min{0.0};
  std::string physical_dimension;
  int sample_frequency{0};
};

struct Header {
  PatientInfo patient;
  std::vector<Channel> channels;

  size_t n_channels() const { return channels.size(); }
};

// One data record's worth of samples: frame[ch][i], index-aligned with
// Header::channels.
using Frame = std::vector<std::vector<double>>;

// Onset and duration are in microseconds relative to the recording start.
// A negative duration means "no duration".
struct Annotation {
  int64_t onset_us{0};
  int64_t duration_us{-1};
  std::string description;
};

enum class FileType {
  kEdfPlus = 0,
  kBdfPlus = 1,
};

// Where the annotation signal(s) are placed among the signals of a record.
enum class AnnotationPosition {
  kStart = 0,
  kMiddle = 1,
  kEnd = 2,
};

} // namespace edfrec
