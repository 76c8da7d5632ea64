#pragma once

#include "edfrec/codec_engine.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>

namespace edfrec {

// Built-in EDF+/BDF+ codec engine.
//
// - EDF+: 16-bit little-endian samples, reserved field "EDF+C"
// - BDF+: 24-bit little-endian samples, version field 0xFF "BIOSEMI", "BDF+C"
//
// Header fields can be set until the first sample write; at that point the
// header is validated and written (with an unknown record count). Each data
// record is assembled in memory and flushed once every data signal has been
// written for it. Annotations are kept in memory and stored into the
// annotation signal(s) when the file is closed; close also rewrites the
// header with the final number of data records.
//
// Notes / limitations:
// - each annotation signal of a record holds one annotation; if there are
//   more annotations than (records x annotation signals), zero-filled data
//   records are appended to hold them
// - an incomplete trailing data record (not every signal written) is dropped
// - annotation text is capped at kMaxAnnotationTextBytes UTF-8 bytes
//
// All methods are safe to call from multiple threads.
class EdfCodecEngine : public CodecEngine {
public:
  static constexpr int kMaxFiles = 64;
  static constexpr int kMaxSignals = 640;
  static constexpr int kMaxAnnotationSignals = 64;

  // Bytes reserved per annotation signal in each data record.
  static constexpr int kAnnotationSlotBytes = 120;

  EdfCodecEngine();
  ~EdfCodecEngine() override;

  EdfCodecEngine(const EdfCodecEngine&) = delete;
  EdfCodecEngine& operator=(const EdfCodecEngine&) = delete;

  int open_file_writeonly(const char* path, FileType type, int number_of_signals) override;
  int close_file(int handle) override;

  int set_patientname(int handle, const char* patientname) override;
  int set_patientcode(int handle, const char* patientcode) override;
  int set_admincode(int handle, const char* admincode) override;
  int set_technician(int handle, const char* technician) override;
  int set_equipment(int handle, const char* equipment) override;
  int set_recording_additional(int handle, const char* recording_additional) override;
  int set_sex(int handle, int sex) override;

  int set_label(int handle, int edfsignal, const char* label) override;
  int set_transducer(int handle, int edfsignal, const char* transducer) override;
  int set_physical_dimension(int handle, int edfsignal, const char* phys_dim) override;
  int set_digital_maximum(int handle, int edfsignal, int dig_max) override;
  int set_digital_minimum(int handle, int edfsignal, int dig_min) override;
  int set_physical_maximum(int handle, int edfsignal, double phys_max) override;
  int set_physical_minimum(int handle, int edfsignal, double phys_min) override;
  int set_samplefrequency(int handle, int edfsignal, int samplefrequency) override;

  int set_datarecord_duration(int handle, int duration) override;
  int set_number_of_annotation_signals(int handle, int annot_signals) override;
  int set_annot_chan_idx_pos(int handle, AnnotationPosition pos) override;

  int write_physical_samples(int handle, const double* buf) override;
  int write_annotation_latin1(int handle, int64_t onset, int64_t duration,
                              const char* description) override;

  // Number of currently open handles.
  int open_file_count() const;

private:
  struct OpenFile;

  // Returns nullptr for unknown/closed handles. Caller holds mutex_.
  OpenFile* find(int handle);
  // Same, but also nullptr once the header has been written.
  OpenFile* find_configurable(int handle);

  mutable std::mutex mutex_;
  std::array<std::unique_ptr<OpenFile>, kMaxFiles> files_;
};

} // namespace edfrec
