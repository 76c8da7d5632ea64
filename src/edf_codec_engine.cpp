#include "edfrec/edf_codec_engine.hpp"

#include "edfrec/header.hpp"
#include "edfrec/tal.hpp"
#include "edfrec/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace edfrec {

namespace {

constexpr int kEngineVersion = 100;

struct SignalParam {
  std::string label;
  std::string transducer;
  std::string physical_dimension;
  int digital_max{0};
  int digital_min{0};
  double physical_max{0.0};
  double physical_min{0.0};
  int samples_per_record{0};

  // Derived when the header is written.
  double bitvalue{1.0};
  double offset{0.0};
};

struct StoredAnnotation {
  int64_t onset_us{0};
  int64_t duration_us{-1};
  std::string text; // UTF-8, sanitized
};

void append_field(std::string* out, const std::string& s, size_t width) {
  std::string v = s;
  if (v.size() > width) v = v.substr(0, width);
  if (v.size() < width) v.append(width - v.size(), ' ');
  out->append(v);
}

std::string format_double_fixed_width(double v, size_t width) {
  // EDF header numeric fields are ASCII. Try a few fixed precisions and fall back to integer.
  for (int prec = 6; prec >= 0; --prec) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.setf(std::ios::fixed);
    oss << std::setprecision(prec) << v;
    std::string s = oss.str();
    if (s.find('.') != std::string::npos) {
      while (!s.empty() && s.back() == '0') s.pop_back();
      if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    if (s.size() <= width) return s;
  }
  const long long iv = static_cast<long long>(std::llround(v));
  std::string s = std::to_string(iv);
  if (s.size() > width) s = s.substr(0, width);
  return s;
}

// EDF+ identification subfields: spaces are replaced by '_' and empty
// subfields are written as "X".
std::string header_subfield(const std::string& latin1) {
  std::string s = trim(latin1_to_header_ascii(latin1));
  if (s.empty()) return "X";
  std::replace(s.begin(), s.end(), ' ', '_');
  return s;
}

std::string two_digits(int v) {
  std::ostringstream oss;
  oss << std::setw(2) << std::setfill('0') << v;
  return oss.str();
}

void put_sample(std::vector<char>* out, size_t pos, int32_t v, int bytes_per_sample) {
  const uint32_t u = static_cast<uint32_t>(v);
  (*out)[pos + 0] = static_cast<char>(u & 0xFFu);
  (*out)[pos + 1] = static_cast<char>((u >> 8) & 0xFFu);
  if (bytes_per_sample == 3) {
    (*out)[pos + 2] = static_cast<char>((u >> 16) & 0xFFu);
  }
}

} // namespace

struct EdfCodecEngine::OpenFile {
  std::string path;
  FileType type{FileType::kEdfPlus};
  std::fstream f;
  std::tm start{};

  std::string patient_name;
  std::string patient_code;
  std::string admin_code;
  std::string technician;
  std::string equipment;
  std::string recording_additional;
  int sex{-1};

  std::vector<SignalParam> signals;
  int64_t datarecord_duration{kTicksPerSecond};
  int annotation_signals{1};
  AnnotationPosition annotation_position{AnnotationPosition::kEnd};

  bool header_written{false};
  // Set when a record could not be stored; further sample writes are refused.
  bool write_failed{false};

  // Layout, fixed when the header is written. Entries >= 0 are data signal
  // indices, negative entries are annotation signals (-1 - k).
  std::vector<int> file_signals;
  std::vector<size_t> annotation_slot_offset;
  size_t record_bytes{0};
  int64_t header_bytes{0};

  int signal_cursor{0};
  std::vector<std::vector<int32_t>> pending;
  int64_t records_written{0};

  std::vector<StoredAnnotation> annotations;

  int bytes_per_sample() const { return edfrec::bytes_per_sample(type); }
  int digital_limit_max() const { return edfrec::digital_limit_max(type); }
  int digital_limit_min() const { return edfrec::digital_limit_min(type); }
  int annotation_samples() const { return kAnnotationSlotBytes / bytes_per_sample(); }

  int64_t record_onset_us(int64_t record) const {
    return record * datarecord_duration * kMicrosecondsPerTick;
  }

  bool header_is_valid() const {
    for (const auto& s : signals) {
      if (s.samples_per_record < 1) return false;
      if (s.digital_min >= s.digital_max) return false;
      if (s.physical_min == s.physical_max) return false;
    }
    return true;
  }

  void compute_layout() {
    const int ns_data = static_cast<int>(signals.size());
    const int ns_ann = annotation_signals;

    int insert_at = ns_data;
    if (annotation_position == AnnotationPosition::kStart) insert_at = 0;
    if (annotation_position == AnnotationPosition::kMiddle) insert_at = ns_data / 2;

    file_signals.clear();
    for (int i = 0; i < ns_data; ++i) {
      if (i == insert_at) {
        for (int k = 0; k < ns_ann; ++k) file_signals.push_back(-1 - k);
      }
      file_signals.push_back(i);
    }
    if (insert_at == ns_data) {
      for (int k = 0; k < ns_ann; ++k) file_signals.push_back(-1 - k);
    }

    const size_t bps = static_cast<size_t>(bytes_per_sample());
    annotation_slot_offset.assign(static_cast<size_t>(ns_ann), 0);
    record_bytes = 0;
    for (int fs : file_signals) {
      if (fs < 0) {
        annotation_slot_offset[static_cast<size_t>(-1 - fs)] = record_bytes;
        record_bytes += static_cast<size_t>(kAnnotationSlotBytes);
      } else {
        record_bytes += static_cast<size_t>(signals[static_cast<size_t>(fs)].samples_per_record) * bps;
      }
    }
    header_bytes = 256 + 256 * static_cast<int64_t>(file_signals.size());
  }

  // Physical min/max exactly as they appear in the header, so the scaling used
  // for writing matches what a reader reconstructs.
  void compute_scaling() {
    for (auto& s : signals) {
      const double pmax = to_double(format_double_fixed_width(s.physical_max, 8));
      const double pmin = to_double(format_double_fixed_width(s.physical_min, 8));
      s.bitvalue = (pmax - pmin) / static_cast<double>(s.digital_max - s.digital_min);
      if (!(std::fabs(s.bitvalue) > 0.0)) s.bitvalue = 1.0;
      s.offset = pmax / s.bitvalue - static_cast<double>(s.digital_max);
    }
  }

  std::string build_header(int64_t num_records) const {
    std::string h;
    h.reserve(static_cast<size_t>(header_bytes));

    if (type == FileType::kBdfPlus) {
      // BDF uses a non-ASCII version field: 0xFF followed by "BIOSEMI".
      h.push_back(static_cast<char>(0xFF));
      h.append("BIOSEMI");
    } else {
      append_field(&h, "0", 8);
    }

    static const char* kMonths[12] = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                      "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
    const int year = start.tm_year + 1900;
    const int month = std::min(std::max(start.tm_mon, 0), 11);

    std::string sex_field = "X";
    if (sex == 0) sex_field = "F";
    if (sex == 1) sex_field = "M";

    // Local patient identification: code sex birthdate name.
    std::string patient = header_subfield(patient_code) + " " + sex_field + " X " +
                          header_subfield(patient_name);
    append_field(&h, patient, 80);

    // Local recording identification: Startdate dd-MMM-yyyy admincode technician equipment.
    std::string recording = "Startdate " + two_digits(start.tm_mday) + "-" + kMonths[month] + "-" +
                            std::to_string(year) + " " + header_subfield(admin_code) + " " +
                            header_subfield(technician) + " " + header_subfield(equipment);
    const std::string additional = trim(latin1_to_header_ascii(recording_additional));
    if (!additional.empty()) recording += " " + additional;
    append_field(&h, recording, 80);

    append_field(&h, two_digits(start.tm_mday) + "." + two_digits(start.tm_mon + 1) + "." +
                         two_digits(year % 100), 8);
    append_field(&h, two_digits(start.tm_hour) + "." + two_digits(start.tm_min) + "." +
                         two_digits(start.tm_sec), 8);
    append_field(&h, std::to_string(header_bytes), 8);
    append_field(&h, type == FileType::kBdfPlus ? "BDF+C" : "EDF+C", 44);
    append_field(&h, std::to_string(num_records), 8);
    append_field(&h, format_tal_duration(datarecord_duration * kMicrosecondsPerTick), 8);
    append_field(&h, std::to_string(file_signals.size()), 4);

    const std::string ann_label = annotation_signal_label(type);
    const std::string ann_dmax = std::to_string(digital_limit_max());
    const std::string ann_dmin = std::to_string(digital_limit_min());

    // Per-signal header, stored field-by-field.
    for (int fs : file_signals) {
      append_field(&h, fs < 0 ? ann_label : latin1_to_header_ascii(signals[static_cast<size_t>(fs)].label), 16);
    }
    for (int fs : file_signals) {
      append_field(&h, fs < 0 ? "" : latin1_to_header_ascii(signals[static_cast<size_t>(fs)].transducer), 80);
    }
    for (int fs : file_signals) {
      append_field(&h, fs < 0 ? "" : latin1_to_header_ascii(signals[static_cast<size_t>(fs)].physical_dimension), 8);
    }
    for (int fs : file_signals) {
      append_field(&h, fs < 0 ? ann_dmin : format_double_fixed_width(signals[static_cast<size_t>(fs)].physical_min, 8), 8);
    }
    for (int fs : file_signals) {
      append_field(&h, fs < 0 ? ann_dmax : format_double_fixed_width(signals[static_cast<size_t>(fs)].physical_max, 8), 8);
    }
    for (int fs : file_signals) {
      append_field(&h, fs < 0 ? ann_dmin : std::to_string(signals[static_cast<size_t>(fs)].digital_min), 8);
    }
    for (int fs : file_signals) {
      append_field(&h, fs < 0 ? ann_dmax : std::to_string(signals[static_cast<size_t>(fs)].digital_max), 8);
    }
    for (size_t i = 0; i < file_signals.size(); ++i) append_field(&h, "", 80);
    for (int fs : file_signals) {
      append_field(&h, std::to_string(fs < 0 ? annotation_samples()
                                             : signals[static_cast<size_t>(fs)].samples_per_record), 8);
    }
    for (size_t i = 0; i < file_signals.size(); ++i) append_field(&h, "", 32);

    return h;
  }

  bool write_header(int64_t num_records) {
    const std::string h = build_header(num_records);
    f.seekp(0, std::ios::beg);
    f.write(h.data(), static_cast<std::streamsize>(h.size()));
    return static_cast<bool>(f);
  }

  // Fix the layout and write the header with an unknown record count.
  bool lock_header() {
    if (header_written) return true;
    compute_layout();
    compute_scaling();
    pending.assign(signals.size(), std::vector<int32_t>());
    if (!write_header(-1)) return false;
    header_written = true;
    return true;
  }

  // Serialize one data record from `pending` (or zeros when `pending` is
  // empty) at the end of the file.
  bool append_record(bool zero_data) {
    std::vector<char> rec(record_bytes, 0);
    const int bps = bytes_per_sample();

    size_t pos = 0;
    for (int fs : file_signals) {
      if (fs < 0) {
        if (fs == -1) {
          const std::string tk = build_tal_timekeeping(record_onset_us(records_written));
          std::copy(tk.begin(), tk.end(), rec.begin() + static_cast<std::ptrdiff_t>(pos));
        }
        pos += static_cast<size_t>(kAnnotationSlotBytes);
        continue;
      }
      const auto& sig = signals[static_cast<size_t>(fs)];
      const size_t n = static_cast<size_t>(sig.samples_per_record);
      if (!zero_data) {
        const auto& dig = pending[static_cast<size_t>(fs)];
        for (size_t i = 0; i < n; ++i) {
          put_sample(&rec, pos + i * static_cast<size_t>(bps), dig[i], bps);
        }
      }
      pos += n * static_cast<size_t>(bps);
    }

    const std::streamoff off = static_cast<std::streamoff>(header_bytes) +
                               static_cast<std::streamoff>(records_written) *
                                   static_cast<std::streamoff>(record_bytes);
    f.seekp(off, std::ios::beg);
    f.write(rec.data(), static_cast<std::streamsize>(rec.size()));
    if (!f) return false;
    ++records_written;
    return true;
  }

  bool write_annotation_slots() {
    const size_t per_record = static_cast<size_t>(annotation_signals);
    const int64_t needed_records =
        static_cast<int64_t>((annotations.size() + per_record - 1) / per_record);
    while (records_written < needed_records) {
      if (!append_record(/*zero_data=*/true)) return false;
    }

    for (size_t j = 0; j < annotations.size(); ++j) {
      const int64_t r = static_cast<int64_t>(j / per_record);
      const size_t k = j % per_record;
      const auto& a = annotations[j];

      std::string slot;
      if (k == 0) slot = build_tal_timekeeping(record_onset_us(r));
      slot += build_tal_entry(a.onset_us, a.duration_us, a.text);
      if (slot.size() > static_cast<size_t>(kAnnotationSlotBytes)) return false;
      slot.resize(static_cast<size_t>(kAnnotationSlotBytes), '\0');

      const std::streamoff off = static_cast<std::streamoff>(header_bytes) +
                                 static_cast<std::streamoff>(r) * static_cast<std::streamoff>(record_bytes) +
                                 static_cast<std::streamoff>(annotation_slot_offset[k]);
      f.seekp(off, std::ios::beg);
      f.write(slot.data(), static_cast<std::streamsize>(slot.size()));
      if (!f) return false;
    }
    return true;
  }
};

EdfCodecEngine::EdfCodecEngine() = default;

EdfCodecEngine::~EdfCodecEngine() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& file : files_) {
    if (file && file->f.is_open()) file->f.close();
    file.reset();
  }
}

EdfCodecEngine::OpenFile* EdfCodecEngine::find(int handle) {
  if (handle < 0 || handle >= kMaxFiles) return nullptr;
  return files_[static_cast<size_t>(handle)].get();
}

EdfCodecEngine::OpenFile* EdfCodecEngine::find_configurable(int handle) {
  OpenFile* file = find(handle);
  if (!file || file->header_written) return nullptr;
  return file;
}

int EdfCodecEngine::open_file_writeonly(const char* path, FileType type, int number_of_signals) {
  if (!path || path[0] == '\0') return -1;
  if (number_of_signals < 0 || number_of_signals > kMaxSignals) return -1;

  std::lock_guard<std::mutex> lock(mutex_);

  const std::string p(path);
  int slot = -1;
  for (int i = 0; i < kMaxFiles; ++i) {
    const auto& file = files_[static_cast<size_t>(i)];
    if (file) {
      if (file->path == p) return -1; // already open for writing
    } else if (slot < 0) {
      slot = i;
    }
  }
  if (slot < 0) return -1;

  auto file = std::make_unique<OpenFile>();
  file->path = p;
  file->type = type;
  file->f.open(std::filesystem::u8path(p),
               std::ios::binary | std::ios::in | std::ios::out | std::ios::trunc);
  if (!file->f) return -1;

  if (!localtime_safe(std::time(nullptr), &file->start)) {
    file->start = std::tm{};
    file->start.tm_year = 85;
    file->start.tm_mday = 1;
  }

  file->signals.resize(static_cast<size_t>(number_of_signals));
  for (auto& s : file->signals) {
    s.digital_max = file->digital_limit_max();
    s.digital_min = file->digital_limit_min();
  }

  files_[static_cast<size_t>(slot)] = std::move(file);
  return slot;
}

int EdfCodecEngine::close_file(int handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find(handle);
  if (!file) return -1;

  bool ok = file->lock_header();
  if (ok) ok = file->write_annotation_slots();
  if (ok) ok = file->write_header(file->records_written);
  if (ok) file->f.flush();
  ok = ok && static_cast<bool>(file->f);
  file->f.close();
  if (file->f.fail()) ok = false;

  files_[static_cast<size_t>(handle)].reset();
  return ok ? 0 : -1;
}

int EdfCodecEngine::set_patientname(int handle, const char* patientname) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !patientname) return -1;
  file->patient_name = patientname;
  return 0;
}

int EdfCodecEngine::set_patientcode(int handle, const char* patientcode) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !patientcode) return -1;
  file->patient_code = patientcode;
  return 0;
}

int EdfCodecEngine::set_admincode(int handle, const char* admincode) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !admincode) return -1;
  file->admin_code = admincode;
  return 0;
}

int EdfCodecEngine::set_technician(int handle, const char* technician) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !technician) return -1;
  file->technician = technician;
  return 0;
}

int EdfCodecEngine::set_equipment(int handle, const char* equipment) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !equipment) return -1;
  file->equipment = equipment;
  return 0;
}

int EdfCodecEngine::set_recording_additional(int handle, const char* recording_additional) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !recording_additional) return -1;
  file->recording_additional = recording_additional;
  return 0;
}

int EdfCodecEngine::set_sex(int handle, int sex) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || (sex != 0 && sex != 1)) return -1;
  file->sex = sex;
  return 0;
}

int EdfCodecEngine::set_label(int handle, int edfsignal, const char* label) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !label) return -1;
  if (edfsignal < 0 || edfsignal >= static_cast<int>(file->signals.size())) return -1;
  file->signals[static_cast<size_t>(edfsignal)].label = label;
  return 0;
}

int EdfCodecEngine::set_transducer(int handle, int edfsignal, const char* transducer) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !transducer) return -1;
  if (edfsignal < 0 || edfsignal >= static_cast<int>(file->signals.size())) return -1;
  file->signals[static_cast<size_t>(edfsignal)].transducer = transducer;
  return 0;
}

int EdfCodecEngine::set_physical_dimension(int handle, int edfsignal, const char* phys_dim) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !phys_dim) return -1;
  if (edfsignal < 0 || edfsignal >= static_cast<int>(file->signals.size())) return -1;
  file->signals[static_cast<size_t>(edfsignal)].physical_dimension = phys_dim;
  return 0;
}

int EdfCodecEngine::set_digital_maximum(int handle, int edfsignal, int dig_max) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file) return -1;
  if (edfsignal < 0 || edfsignal >= static_cast<int>(file->signals.size())) return -1;
  if (dig_max > file->digital_limit_max() || dig_max < file->digital_limit_min()) return -1;
  file->signals[static_cast<size_t>(edfsignal)].digital_max = dig_max;
  return 0;
}

int EdfCodecEngine::set_digital_minimum(int handle, int edfsignal, int dig_min) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file) return -1;
  if (edfsignal < 0 || edfsignal >= static_cast<int>(file->signals.size())) return -1;
  if (dig_min > file->digital_limit_max() || dig_min < file->digital_limit_min()) return -1;
  file->signals[static_cast<size_t>(edfsignal)].digital_min = dig_min;
  return 0;
}

int EdfCodecEngine::set_physical_maximum(int handle, int edfsignal, double phys_max) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !std::isfinite(phys_max)) return -1;
  if (edfsignal < 0 || edfsignal >= static_cast<int>(file->signals.size())) return -1;
  file->signals[static_cast<size_t>(edfsignal)].physical_max = phys_max;
  return 0;
}

int EdfCodecEngine::set_physical_minimum(int handle, int edfsignal, double phys_min) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || !std::isfinite(phys_min)) return -1;
  if (edfsignal < 0 || edfsignal >= static_cast<int>(file->signals.size())) return -1;
  file->signals[static_cast<size_t>(edfsignal)].physical_min = phys_min;
  return 0;
}

int EdfCodecEngine::set_samplefrequency(int handle, int edfsignal, int samplefrequency) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || samplefrequency < 1) return -1;
  if (edfsignal < 0 || edfsignal >= static_cast<int>(file->signals.size())) return -1;
  file->signals[static_cast<size_t>(edfsignal)].samples_per_record = samplefrequency;
  return 0;
}

int EdfCodecEngine::set_datarecord_duration(int handle, int duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file) return -1;
  if (duration < kMinRecordDurationTicks || duration > kMaxRecordDurationTicks) return -1;
  file->datarecord_duration = duration;
  return 0;
}

int EdfCodecEngine::set_number_of_annotation_signals(int handle, int annot_signals) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file || annot_signals < 1 || annot_signals > kMaxAnnotationSignals) return -1;
  file->annotation_signals = annot_signals;
  return 0;
}

int EdfCodecEngine::set_annot_chan_idx_pos(int handle, AnnotationPosition pos) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find_configurable(handle);
  if (!file) return -1;
  switch (pos) {
    case AnnotationPosition::kStart:
    case AnnotationPosition::kMiddle:
    case AnnotationPosition::kEnd:
      file->annotation_position = pos;
      return 0;
  }
  return -1;
}

int EdfCodecEngine::write_physical_samples(int handle, const double* buf) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find(handle);
  if (!file || !buf || file->signals.empty() || file->write_failed) return -1;

  if (!file->header_written) {
    if (!file->header_is_valid()) return -1;
    if (!file->lock_header()) {
      file->write_failed = true;
      return -1;
    }
  }

  const size_t ch = static_cast<size_t>(file->signal_cursor);
  const SignalParam& sig = file->signals[ch];
  const size_t n = static_cast<size_t>(sig.samples_per_record);

  std::vector<int32_t>& dig = file->pending[ch];
  dig.resize(n);
  for (size_t i = 0; i < n; ++i) {
    double phys = buf[i];
    if (!std::isfinite(phys)) phys = 0.0;
    const double d = phys / sig.bitvalue - sig.offset;
    long long di = std::llround(d);
    if (di < sig.digital_min) di = sig.digital_min;
    if (di > sig.digital_max) di = sig.digital_max;
    dig[i] = static_cast<int32_t>(di);
  }

  ++file->signal_cursor;
  if (file->signal_cursor < static_cast<int>(file->signals.size())) return 0;

  file->signal_cursor = 0;
  if (!file->append_record(/*zero_data=*/false)) {
    file->write_failed = true;
    return -1;
  }
  return 0;
}

int EdfCodecEngine::write_annotation_latin1(int handle, int64_t onset, int64_t duration,
                                            const char* description) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile* file = find(handle);
  if (!file || !description) return -1;

  StoredAnnotation a;
  a.onset_us = onset;
  a.duration_us = duration < 0 ? -1 : duration;
  a.text = sanitize_tal_text(latin1_to_utf8(description));
  if (a.text.empty()) return -1;
  file->annotations.push_back(std::move(a));
  return 0;
}

int EdfCodecEngine::open_file_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  int n = 0;
  for (const auto& file : files_) {
    if (file) ++n;
  }
  return n;
}

int codec_engine_version() {
  return kEngineVersion;
}

std::string codec_engine_version_string() {
  std::ostringstream oss;
  oss << (kEngineVersion / 100) << "." << std::setw(2) << std::setfill('0') << (kEngineVersion % 100);
  return oss.str();
}

std::shared_ptr<CodecEngine> default_codec_engine() {
  static const std::shared_ptr<CodecEngine> engine = std::make_shared<EdfCodecEngine>();
  return engine;
}

} // namespace edfrec
