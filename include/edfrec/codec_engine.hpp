#pragma once

#include "edfrec/types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace edfrec {

// Handle-based codec engine ABI.
//
// Every call returns a signed status: negative means failure (no further
// detail), zero or positive means success. open_file_writeonly() returns the
// new handle on success.
//
// Text arguments are null-terminated Latin-1 byte strings.
//
// Typical sequence:
//   hdl = open_file_writeonly(path, type, n)
//   set_*(hdl, ...)                        // header, before the first write
//   write_physical_samples(hdl, buf) x n   // one call per signal, per record
//   write_annotation_latin1(hdl, ...)      // any time while open
//   close_file(hdl)
class CodecEngine {
public:
  virtual ~CodecEngine() = default;

  virtual int open_file_writeonly(const char* path, FileType type, int number_of_signals) = 0;
  virtual int close_file(int handle) = 0;

  virtual int set_patientname(int handle, const char* patientname) = 0;
  virtual int set_patientcode(int handle, const char* patientcode) = 0;
  virtual int set_admincode(int handle, const char* admincode) = 0;
  virtual int set_technician(int handle, const char* technician) = 0;
  virtual int set_equipment(int handle, const char* equipment) = 0;
  virtual int set_recording_additional(int handle, const char* recording_additional) = 0;
  // 0 = female, 1 = male.
  virtual int set_sex(int handle, int sex) = 0;

  virtual int set_label(int handle, int edfsignal, const char* label) = 0;
  virtual int set_transducer(int handle, int edfsignal, const char* transducer) = 0;
  virtual int set_physical_dimension(int handle, int edfsignal, const char* phys_dim) = 0;
  virtual int set_digital_maximum(int handle, int edfsignal, int dig_max) = 0;
  virtual int set_digital_minimum(int handle, int edfsignal, int dig_min) = 0;
  virtual int set_physical_maximum(int handle, int edfsignal, double phys_max) = 0;
  virtual int set_physical_minimum(int handle, int edfsignal, double phys_min) = 0;
  // Number of samples per data record.
  virtual int set_samplefrequency(int handle, int edfsignal, int samplefrequency) = 0;

  // Duration in units of 10 microseconds.
  virtual int set_datarecord_duration(int handle, int duration) = 0;
  virtual int set_number_of_annotation_signals(int handle, int annot_signals) = 0;
  virtual int set_annot_chan_idx_pos(int handle, AnnotationPosition pos) = 0;

  // Write one data record's worth of samples (samplefrequency values) for the
  // next signal in order. After the last signal the record is complete and
  // the next call starts a new record with signal 0.
  virtual int write_physical_samples(int handle, const double* buf) = 0;

  // Onset and duration in microseconds; a negative duration is omitted.
  virtual int write_annotation_latin1(int handle, int64_t onset, int64_t duration,
                                      const char* description) = 0;
};

// Version number of the built-in engine (e.g. 100 for 1.00).
int codec_engine_version();

// "1.00"
std::string codec_engine_version_string();

// Process-wide instance of the built-in EDF+/BDF+ engine.
std::shared_ptr<CodecEngine> default_codec_engine();

} // namespace edfrec
