#pragma once

#include "edfrec/codec_engine.hpp"
#include "edfrec/options.hpp"
#include "edfrec/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace edfrec {

enum class SessionState {
  kUnopened,
  kOpen,
  kClosed,
};

// One open recording on a codec engine.
//
// The session exclusively owns the engine handle and releases it exactly once
// (finish() or the destructor). All calls are serialized on an internal mutex,
// so a session may be shared between threads via std::shared_ptr.
//
// Text is UTF-8 on this side and converted to Latin-1 for the engine.
class Session {
public:
  explicit Session(std::shared_ptr<CodecEngine> engine);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Open the file (type chosen from the extension) and run the header setup
  // sequence. Throws OpenError if the engine refuses or the session was
  // already opened, ConfigError if a header field is rejected. After a
  // ConfigError the handle stays open: finish() must still be called and
  // writes raise NotOpenError.
  void open(const std::string& path, const Header& header,
            const WriterOptions& options = WriterOptions());

  SessionState state() const;
  bool is_open() const;
  // True once open() completed the whole header setup and no sample write has
  // failed since.
  bool is_writable() const;

  std::string path() const;
  FileType file_type() const;
  // Header as configured so far (sample frequencies track set_sample_frequency).
  Header header() const;

  // --- patient / recording identification ---
  void set_patient_name(const std::string& v);
  void set_patient_code(const std::string& v);
  void set_admin_code(const std::string& v);
  void set_technician(const std::string& v);
  void set_equipment(const std::string& v);
  void set_sex(Sex sex);
  void set_recording_additional(const std::string& v);

  // Not supported; always throw UnsupportedOperation.
  void set_birthdate(int year, int month, int day);
  void set_start_datetime(int year, int month, int day, int hour, int minute, int second);

  // --- per channel ---
  void set_label(int channel, const std::string& v);
  void set_transducer(int channel, const std::string& v);
  void set_digital_max(int channel, int v);
  void set_digital_min(int channel, int v);
  void set_physical_max(int channel, double v);
  void set_physical_min(int channel, double v);
  void set_physical_dimension(int channel, const std::string& v);
  void set_sample_frequency(int channel, int v);

  // --- record layout ---
  void set_record_duration(std::chrono::microseconds d);
  void set_annotation_signals(int n);
  void set_annotation_position(AnnotationPosition pos);

  // Write samples for one channel. The length must be a non-zero multiple of
  // the channel's sample frequency; the buffer is passed to the engine one
  // record-sized chunk at a time. Channels must be written in index order,
  // and with more than one channel each call carries exactly one record.
  // Violations raise ShapeError before any engine call.
  void write_record(int channel, const std::vector<double>& samples);

  // Write every channel of a frame under a single lock acquisition. All
  // channels are shape-checked before the first engine call and must hold
  // the same number of records; these are written record by record.
  void write_frame(const Frame& frame);

  void write_annotation(int64_t onset_us, int64_t duration_us, const std::string& text);

  // Close the handle. No-op when never opened or already closed. Throws
  // CloseError if the engine reports a failure (the handle is released
  // regardless).
  void finish();

private:
  void require_open(const char* what) const;
  void require_configured(const char* what) const;
  // require_configured() plus no failed sample write.
  void require_writable(const char* what) const;
  void require_channel(const char* field, int channel) const;
  void check_config(int status, const char* field, int channel = -1) const;

  void setup_header(const WriterOptions& options);
  void apply_record_duration(std::chrono::microseconds d);
  // Returns the number of records in a buffer of n samples for channel.
  size_t check_record_shape(int channel, size_t n) const;
  // Hand record `period` of samples to the engine.
  void write_chunk(int channel, const std::vector<double>& samples, size_t period);

  std::shared_ptr<CodecEngine> engine_;
  mutable std::mutex mutex_;

  SessionState state_{SessionState::kUnopened};
  bool configured_{false};
  // After a rejected sample write the engine's record position is unknown.
  bool write_failed_{false};
  // Channel the engine expects next within the current record.
  int next_channel_{0};
  int handle_{-1};
  std::string path_;
  FileType file_type_{FileType::kEdfPlus};
  Header header_;
};

} // namespace edfrec
