#include "edfrec/session.hpp"

#include "edfrec/errors.hpp"
#include "edfrec/header.hpp"
#include "edfrec/utils.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace edfrec {

Session::Session(std::shared_ptr<CodecEngine> engine)
    : engine_(engine ? std::move(engine) : default_codec_engine()) {}

Session::~Session() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::kOpen) return;
  const int status = engine_->close_file(handle_);
  state_ = SessionState::kClosed;
  handle_ = -1;
  if (status < 0) {
    std::cerr << "Warning: failed to close recording '" << path_ << "'\n";
  }
}

void Session::open(const std::string& path, const Header& header, const WriterOptions& options) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::kUnopened) {
    throw OpenError("session for '" + path_ + "' was already opened");
  }

  const FileType type = file_type_from_path(path);
  const int handle = engine_->open_file_writeonly(path.c_str(), type,
                                                  static_cast<int>(header.n_channels()));
  if (handle < 0) {
    throw OpenError("cannot open '" + path + "' for writing as " + file_type_name(type) +
                    " with " + std::to_string(header.n_channels()) + " signals");
  }

  handle_ = handle;
  path_ = path;
  file_type_ = type;
  header_ = header;
  state_ = SessionState::kOpen;

  setup_header(options);
  configured_ = true;
}

void Session::setup_header(const WriterOptions& options) {
  const PatientInfo& p = header_.patient;
  check_config(engine_->set_equipment(handle_, utf8_to_latin1(p.equipment).c_str()), "equipment");
  check_config(engine_->set_patientname(handle_, utf8_to_latin1(p.name).c_str()), "patient_name");
  check_config(engine_->set_patientcode(handle_, utf8_to_latin1(p.code).c_str()), "patient_code");
  check_config(engine_->set_sex(handle_, static_cast<int>(p.sex)), "sex");
  check_config(engine_->set_admincode(handle_, utf8_to_latin1(p.admin_code).c_str()), "admin_code");
  check_config(engine_->set_technician(handle_, utf8_to_latin1(p.technician).c_str()), "technician");

  for (size_t i = 0; i < header_.channels.size(); ++i) {
    const Channel& c = header_.channels[i];
    const int ch = static_cast<int>(i);
    check_config(engine_->set_label(handle_, ch, utf8_to_latin1(c.label).c_str()), "label", ch);
    check_config(engine_->set_transducer(handle_, ch, utf8_to_latin1(c.transducer).c_str()),
                 "transducer", ch);
    check_config(engine_->set_digital_maximum(handle_, ch, c.digital_max), "digital_max", ch);
    check_config(engine_->set_digital_minimum(handle_, ch, c.digital_min), "digital_min", ch);
    check_config(engine_->set_physical_maximum(handle_, ch, c.physical_max), "physical_max", ch);
    check_config(engine_->set_physical_minimum(handle_, ch, c.physical_min), "physical_min", ch);
    check_config(engine_->set_physical_dimension(handle_, ch,
                                                 utf8_to_latin1(c.physical_dimension).c_str()),
                 "physical_dimension", ch);
    check_config(engine_->set_samplefrequency(handle_, ch, c.sample_frequency),
                 "sample_frequency", ch);
  }

  apply_record_duration(options.record_duration);
  if (options.annotation_signals != 1) {
    check_config(engine_->set_number_of_annotation_signals(handle_, options.annotation_signals),
                 "annotation_signals");
  }
  if (options.annotation_position != AnnotationPosition::kEnd) {
    check_config(engine_->set_annot_chan_idx_pos(handle_, options.annotation_position),
                 "annotation_position");
  }
  if (!options.recording_additional.empty()) {
    check_config(engine_->set_recording_additional(
                     handle_, utf8_to_latin1(options.recording_additional).c_str()),
                 "recording_additional");
  }
}

SessionState Session::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool Session::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == SessionState::kOpen;
}

bool Session::is_writable() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == SessionState::kOpen && configured_ && !write_failed_;
}

std::string Session::path() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return path_;
}

FileType Session::file_type() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_type_;
}

Header Session::header() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return header_;
}

void Session::require_open(const char* what) const {
  if (state_ != SessionState::kOpen) {
    throw NotOpenError(std::string(what) + ": session is not open");
  }
}

void Session::require_configured(const char* what) const {
  require_open(what);
  if (!configured_) {
    throw NotOpenError(std::string(what) + ": header setup did not complete");
  }
}

void Session::require_writable(const char* what) const {
  require_configured(what);
  if (write_failed_) {
    throw NotOpenError(std::string(what) + ": an earlier sample write failed");
  }
}

void Session::require_channel(const char* field, int channel) const {
  if (channel < 0 || channel >= static_cast<int>(header_.channels.size())) {
    throw ConfigError(field, "channel index out of range", channel);
  }
}

void Session::check_config(int status, const char* field, int channel) const {
  if (status < 0) {
    throw ConfigError(field, "rejected by the codec engine", channel);
  }
}

void Session::set_patient_name(const std::string& v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("patient_name");
  check_config(engine_->set_patientname(handle_, utf8_to_latin1(v).c_str()), "patient_name");
  header_.patient.name = v;
}

void Session::set_patient_code(const std::string& v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("patient_code");
  check_config(engine_->set_patientcode(handle_, utf8_to_latin1(v).c_str()), "patient_code");
  header_.patient.code = v;
}

void Session::set_admin_code(const std::string& v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("admin_code");
  check_config(engine_->set_admincode(handle_, utf8_to_latin1(v).c_str()), "admin_code");
  header_.patient.admin_code = v;
}

void Session::set_technician(const std::string& v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("technician");
  check_config(engine_->set_technician(handle_, utf8_to_latin1(v).c_str()), "technician");
  header_.patient.technician = v;
}

void Session::set_equipment(const std::string& v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("equipment");
  check_config(engine_->set_equipment(handle_, utf8_to_latin1(v).c_str()), "equipment");
  header_.patient.equipment = v;
}

void Session::set_sex(Sex sex) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("sex");
  check_config(engine_->set_sex(handle_, static_cast<int>(sex)), "sex");
  header_.patient.sex = sex;
}

void Session::set_recording_additional(const std::string& v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("recording_additional");
  check_config(engine_->set_recording_additional(handle_, utf8_to_latin1(v).c_str()),
               "recording_additional");
}

void Session::set_birthdate(int /*year*/, int /*month*/, int /*day*/) {
  throw UnsupportedOperation("birthdate");
}

void Session::set_start_datetime(int /*year*/, int /*month*/, int /*day*/, int /*hour*/,
                                 int /*minute*/, int /*second*/) {
  throw UnsupportedOperation("start_datetime");
}

void Session::set_label(int channel, const std::string& v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("label");
  require_channel("label", channel);
  check_config(engine_->set_label(handle_, channel, utf8_to_latin1(v).c_str()), "label", channel);
  header_.channels[static_cast<size_t>(channel)].label = v;
}

void Session::set_transducer(int channel, const std::string& v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("transducer");
  require_channel("transducer", channel);
  check_config(engine_->set_transducer(handle_, channel, utf8_to_latin1(v).c_str()),
               "transducer", channel);
  header_.channels[static_cast<size_t>(channel)].transducer = v;
}

void Session::set_digital_max(int channel, int v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("digital_max");
  require_channel("digital_max", channel);
  check_config(engine_->set_digital_maximum(handle_, channel, v), "digital_max", channel);
  header_.channels[static_cast<size_t>(channel)].digital_max = v;
}

void Session::set_digital_min(int channel, int v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("digital_min");
  require_channel("digital_min", channel);
  check_config(engine_->set_digital_minimum(handle_, channel, v), "digital_min", channel);
  header_.channels[static_cast<size_t>(channel)].digital_min = v;
}

void Session::set_physical_max(int channel, double v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("physical_max");
  require_channel("physical_max", channel);
  check_config(engine_->set_physical_maximum(handle_, channel, v), "physical_max", channel);
  header_.channels[static_cast<size_t>(channel)].physical_max = v;
}

void Session::set_physical_min(int channel, double v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("physical_min");
  require_channel("physical_min", channel);
  check_config(engine_->set_physical_minimum(handle_, channel, v), "physical_min", channel);
  header_.channels[static_cast<size_t>(channel)].physical_min = v;
}

void Session::set_physical_dimension(int channel, const std::string& v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("physical_dimension");
  require_channel("physical_dimension", channel);
  check_config(engine_->set_physical_dimension(handle_, channel, utf8_to_latin1(v).c_str()),
               "physical_dimension", channel);
  header_.channels[static_cast<size_t>(channel)].physical_dimension = v;
}

void Session::set_sample_frequency(int channel, int v) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("sample_frequency");
  require_channel("sample_frequency", channel);
  check_config(engine_->set_samplefrequency(handle_, channel, v), "sample_frequency", channel);
  header_.channels[static_cast<size_t>(channel)].sample_frequency = v;
}

void Session::set_record_duration(std::chrono::microseconds d) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("recording_duration");
  apply_record_duration(d);
}

void Session::apply_record_duration(std::chrono::microseconds d) {
  if (!is_valid_record_duration(d)) {
    throw ConfigError("recording_duration",
                      "duration of " + std::to_string(d.count()) +
                          " us is outside 1000 .. 60000000 us");
  }
  check_config(engine_->set_datarecord_duration(handle_, static_cast<int>(record_duration_ticks(d))),
               "recording_duration");
}

void Session::set_annotation_signals(int n) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("annotation_signals");
  check_config(engine_->set_number_of_annotation_signals(handle_, n), "annotation_signals");
}

void Session::set_annotation_position(AnnotationPosition pos) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("annotation_position");
  check_config(engine_->set_annot_chan_idx_pos(handle_, pos), "annotation_position");
}

size_t Session::check_record_shape(int channel, size_t n) const {
  if (channel < 0 || channel >= static_cast<int>(header_.channels.size())) {
    throw ShapeError("channel index out of range", channel);
  }
  const int sf = header_.channels[static_cast<size_t>(channel)].sample_frequency;
  if (sf <= 0) {
    throw ShapeError("channel has no positive sample frequency", channel);
  }
  if (n == 0 || n % static_cast<size_t>(sf) != 0) {
    throw ShapeError("got " + std::to_string(n) + " samples, expected a non-zero multiple of " +
                         std::to_string(sf),
                     channel);
  }
  return n / static_cast<size_t>(sf);
}

void Session::write_chunk(int channel, const std::vector<double>& samples, size_t period) {
  const size_t len =
      static_cast<size_t>(header_.channels[static_cast<size_t>(channel)].sample_frequency);
  if (engine_->write_physical_samples(handle_, samples.data() + period * len) < 0) {
    write_failed_ = true;
    throw WriteError("codec engine rejected the samples", channel);
  }
}

void Session::write_record(int channel, const std::vector<double>& samples) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_writable("write_record");
  const size_t periods = check_record_shape(channel, samples.size());
  if (channel != next_channel_) {
    throw ShapeError("channel " + std::to_string(channel) + " written out of order, expected " +
                         std::to_string(next_channel_),
                     channel);
  }
  if (periods > 1 && header_.channels.size() > 1) {
    throw ShapeError("got " + std::to_string(periods) +
                         " records for one channel; interleaved channels take one record per call",
                     channel);
  }
  for (size_t p = 0; p < periods; ++p) write_chunk(channel, samples, p);
  next_channel_ = (channel + 1) % static_cast<int>(header_.channels.size());
}

void Session::write_frame(const Frame& frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_writable("write_frame");
  if (frame.size() != header_.channels.size()) {
    throw ShapeError("frame has " + std::to_string(frame.size()) + " channels, header has " +
                     std::to_string(header_.channels.size()));
  }
  if (next_channel_ != 0) {
    throw ShapeError("a partial record is pending, next channel is " +
                     std::to_string(next_channel_));
  }
  size_t periods = 0;
  for (size_t ch = 0; ch < frame.size(); ++ch) {
    const size_t k = check_record_shape(static_cast<int>(ch), frame[ch].size());
    if (ch == 0) {
      periods = k;
    } else if (k != periods) {
      throw ShapeError("channel holds " + std::to_string(k) + " records, channel 0 holds " +
                           std::to_string(periods),
                       static_cast<int>(ch));
    }
  }
  // Record-major: every channel of record p before any channel of record p + 1.
  for (size_t p = 0; p < periods; ++p) {
    for (size_t ch = 0; ch < frame.size(); ++ch) {
      write_chunk(static_cast<int>(ch), frame[ch], p);
    }
  }
}

void Session::write_annotation(int64_t onset_us, int64_t duration_us, const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_configured("write_annotation");
  const std::string latin1 = utf8_to_latin1(text);
  if (engine_->write_annotation_latin1(handle_, onset_us, duration_us, latin1.c_str()) < 0) {
    throw AnnotationError("codec engine rejected annotation '" + text + "' at " +
                          std::to_string(onset_us) + " us");
  }
}

void Session::finish() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::kOpen) return;
  const int status = engine_->close_file(handle_);
  state_ = SessionState::kClosed;
  configured_ = false;
  handle_ = -1;
  if (status < 0) {
    throw CloseError("codec engine failed to close '" + path_ + "'");
  }
}

} // namespace edfrec
