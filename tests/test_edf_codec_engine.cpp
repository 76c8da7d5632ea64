#include "test_support.hpp"

#include "edfrec/codec_engine.hpp"
#include "edfrec/edf_codec_engine.hpp"

#include "edf_test_reader.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace edfrec;
using edfrec_test::ParsedFile;
using edfrec_test::read_edf_file;

static std::string temp_path(const std::string& name) {
  return (std::filesystem::temp_directory_path() / ("edfrec_test_engine_" + name)).string();
}

// Configure signal s with a symmetric physical range and the given samples per record.
static void configure_signal(EdfCodecEngine& e, int h, int s, int spr, double range,
                             int dmin = -32768, int dmax = 32767) {
  assert(e.set_label(h, s, ("S" + std::to_string(s)).c_str()) == 0);
  assert(e.set_physical_dimension(h, s, "uV") == 0);
  assert(e.set_physical_maximum(h, s, range) == 0);
  assert(e.set_physical_minimum(h, s, -range) == 0);
  assert(e.set_digital_maximum(h, s, dmax) == 0);
  assert(e.set_digital_minimum(h, s, dmin) == 0);
  assert(e.set_samplefrequency(h, s, spr) == 0);
}

static void test_version() {
  assert(codec_engine_version() == 100);
  assert(codec_engine_version_string() == "1.00");
  assert(default_codec_engine() == default_codec_engine());
}

static void test_header_and_samples_edf() {
  const std::string path = temp_path("header.edf");
  EdfCodecEngine e;
  const int h = e.open_file_writeonly(path.c_str(), FileType::kEdfPlus, 2);
  assert(h >= 0);
  assert(e.open_file_count() == 1);

  assert(e.set_patientname(h, "Jan Demo") == 0);
  assert(e.set_patientcode(h, "0001") == 0);
  assert(e.set_sex(h, 1) == 0);
  assert(e.set_admincode(h, "A1") == 0);
  assert(e.set_technician(h, "Tech") == 0);
  assert(e.set_equipment(h, "Amp") == 0);
  assert(e.set_recording_additional(h, "run 2") == 0);
  assert(e.set_transducer(h, 0, "AgAgCl") == 0);
  configure_signal(e, h, 0, 4, 100.0);
  configure_signal(e, h, 1, 2, 50.0);
  assert(e.set_datarecord_duration(h, 50000) == 0); // 0.5 s

  // Out-of-range digital limits for EDF.
  assert(e.set_digital_maximum(h, 0, 32768) < 0);
  assert(e.set_digital_minimum(h, 0, -32769) < 0);
  assert(e.set_datarecord_duration(h, 99) < 0);
  assert(e.set_sex(h, 2) < 0);

  const double r0a[4] = {0.0, 50.0, -50.0, 100.0};
  const double r0b[2] = {25.0, -25.0};
  const double r1a[4] = {1000.0, -1000.0, std::numeric_limits<double>::quiet_NaN(), 12.5};
  const double r1b[2] = {0.0, 10.0};
  assert(e.write_physical_samples(h, r0a) == 0);

  // Header is locked after the first write.
  assert(e.set_patientname(h, "Late") < 0);
  assert(e.set_samplefrequency(h, 0, 8) < 0);

  assert(e.write_physical_samples(h, r0b) == 0);
  assert(e.write_physical_samples(h, r1a) == 0);
  assert(e.write_physical_samples(h, r1b) == 0);
  // Incomplete third record: dropped at close.
  assert(e.write_physical_samples(h, r0a) == 0);

  assert(e.close_file(h) == 0);
  assert(e.open_file_count() == 0);
  assert(e.close_file(h) < 0);

  const ParsedFile f = read_edf_file(path);
  assert(!f.bdf);
  assert(f.version == "0       ");
  assert(f.reserved == "EDF+C");
  assert(f.patient == "0001 M X Jan_Demo");
  assert(f.recording.find("Startdate ") == 0);
  assert(f.recording.find(" A1 Tech Amp run 2") != std::string::npos);
  assert(f.start_date.size() == 8 && f.start_date[2] == '.' && f.start_date[5] == '.');
  assert(f.start_time.size() == 8 && f.start_time[2] == '.' && f.start_time[5] == '.');
  assert(f.n_records == 2);
  assert(f.record_duration == 0.5);
  assert(f.n_signals == 3);
  assert(f.header_bytes == 256 + 3 * 256);
  assert(f.signals[0].label == "S0");
  assert(f.signals[0].transducer == "AgAgCl");
  assert(f.signals[1].samples_per_record == 2);
  assert(f.signals[2].label == "EDF Annotations");
  assert(f.signals[2].samples_per_record == EdfCodecEngine::kAnnotationSlotBytes / 2);
  assert(f.file_size == static_cast<size_t>(f.header_bytes) +
                            2 * (4 * 2 + 2 * 2 + EdfCodecEngine::kAnnotationSlotBytes));

  const double bv0 = 200.0 / 65535.0;
  const std::vector<double>& s0 = f.data[0];
  assert(s0.size() == 8);
  for (int i = 0; i < 4; ++i) assert(std::fabs(s0[static_cast<size_t>(i)] - r0a[i]) <= bv0);
  assert(std::fabs(s0[4] - 100.0) <= bv0);  // clamped
  assert(std::fabs(s0[5] + 100.0) <= bv0);  // clamped
  assert(std::fabs(s0[6]) <= bv0);          // NaN stored as 0
  assert(std::fabs(f.data[1][1] + 25.0) <= 100.0 / 65535.0);

  // Time-keeping TALs, one per record.
  assert(f.record_onsets.size() == 2);
  assert(f.record_onsets[0] == 0.0);
  assert(f.record_onsets[1] == 0.5);
  assert(f.annotations.empty());

  std::filesystem::remove(path);
}

static void test_bdf_limits_and_layout() {
  const std::string path = temp_path("limits.bdf");
  EdfCodecEngine e;
  const int h = e.open_file_writeonly(path.c_str(), FileType::kBdfPlus, 1);
  assert(h >= 0);
  configure_signal(e, h, 0, 3, 1000.0, -8388608, 8388607);
  assert(e.set_digital_maximum(h, 0, 8388608) < 0);
  assert(e.set_annot_chan_idx_pos(h, AnnotationPosition::kStart) == 0);

  const double rec[3] = {-1000.0, 0.0, 999.0};
  assert(e.write_physical_samples(h, rec) == 0);
  assert(e.close_file(h) == 0);

  const ParsedFile f = read_edf_file(path);
  assert(f.bdf);
  assert(f.version.substr(1) == "BIOSEMI");
  assert(f.reserved == "BDF+C");
  assert(f.signals[0].label == "BDF Annotations");
  assert(f.signals[0].samples_per_record == EdfCodecEngine::kAnnotationSlotBytes / 3);
  assert(f.signals[0].digital_max == 8388607);
  assert(f.signals[1].label == "S0");
  assert(f.first_digital.size() == 1);
  assert(f.first_digital[0] == -8388608);

  const double bv = 2000.0 / 16777215.0;
  const std::vector<double>& s = f.data[static_cast<size_t>(f.data_signal(0))];
  assert(s.size() == 3);
  for (int i = 0; i < 3; ++i) assert(std::fabs(s[static_cast<size_t>(i)] - rec[i]) <= bv);

  std::filesystem::remove(path);
}

static void test_annotations_and_overflow() {
  const std::string path = temp_path("annotations.edf");
  EdfCodecEngine e;
  const int h = e.open_file_writeonly(path.c_str(), FileType::kEdfPlus, 1);
  assert(h >= 0);
  configure_signal(e, h, 0, 2, 10.0);

  const double rec[2] = {1.0, 2.0};
  assert(e.write_physical_samples(h, rec) == 0);

  assert(e.write_annotation_latin1(h, 0, 0, "Start") == 0);
  assert(e.write_annotation_latin1(h, 1500000, 250000, "M\xFCller") == 0);
  assert(e.write_annotation_latin1(h, 3000000, -1, "a\x14" "b") == 0);
  assert(e.write_annotation_latin1(h, 0, -1, "   ") < 0);

  assert(e.close_file(h) == 0);

  const ParsedFile f = read_edf_file(path);
  // One record of data, two zero-filled records appended for annotations.
  assert(f.n_records == 3);
  assert(f.record_onsets.size() == 3);
  assert(f.record_onsets[2] == 2.0);
  assert(f.data[0].size() == 6);
  assert(std::fabs(f.data[0][4]) <= 20.0 / 65535.0 + 1e-12);

  assert(f.annotations.size() == 3);
  assert(f.annotations[0].text == "Start");
  assert(f.annotations[0].onset_sec == 0.0);
  assert(f.annotations[0].duration_sec == 0.0);
  assert(f.annotations[1].text == "M\xC3\xBCller");
  assert(f.annotations[1].onset_sec == 1.5);
  assert(f.annotations[1].duration_sec == 0.25);
  assert(f.annotations[2].text == "a b");
  assert(f.annotations[2].duration_sec == -1.0);

  std::filesystem::remove(path);
}

static void test_multiple_annotation_signals() {
  const std::string path = temp_path("multi_annotations.edf");
  EdfCodecEngine e;
  const int h = e.open_file_writeonly(path.c_str(), FileType::kEdfPlus, 2);
  assert(h >= 0);
  configure_signal(e, h, 0, 1, 10.0);
  configure_signal(e, h, 1, 1, 10.0);
  assert(e.set_number_of_annotation_signals(h, 2) == 0);
  assert(e.set_number_of_annotation_signals(h, 0) < 0);
  assert(e.set_annot_chan_idx_pos(h, AnnotationPosition::kMiddle) == 0);

  for (int i = 0; i < 3; ++i) {
    assert(e.write_annotation_latin1(h, i * 1000000, -1, ("A" + std::to_string(i)).c_str()) == 0);
  }
  const double one[1] = {1.0};
  assert(e.write_physical_samples(h, one) == 0);
  assert(e.write_physical_samples(h, one) == 0);
  assert(e.close_file(h) == 0);

  const ParsedFile f = read_edf_file(path);
  assert(f.n_signals == 4);
  assert(f.signals[0].label == "S0");
  assert(f.signals[1].label == "EDF Annotations");
  assert(f.signals[2].label == "EDF Annotations");
  assert(f.signals[3].label == "S1");
  // Two slots per record: three annotations need two records.
  assert(f.n_records == 2);
  assert(f.annotations.size() == 3);
  assert(f.annotations[2].text == "A2");

  std::filesystem::remove(path);
}

static void test_handles_and_validation() {
  const std::string path = temp_path("handles.edf");
  EdfCodecEngine e;

  assert(e.open_file_writeonly("", FileType::kEdfPlus, 1) < 0);
  assert(e.open_file_writeonly(path.c_str(), FileType::kEdfPlus, EdfCodecEngine::kMaxSignals + 1) < 0);

  const int h = e.open_file_writeonly(path.c_str(), FileType::kEdfPlus, 1);
  assert(h >= 0);
  // Same path cannot be opened twice.
  assert(e.open_file_writeonly(path.c_str(), FileType::kEdfPlus, 1) < 0);

  // Unknown handles.
  assert(e.set_patientname(h + 1, "x") < 0);
  assert(e.write_physical_samples(-1, nullptr) < 0);
  assert(e.set_label(h, 1, "x") < 0);

  // Sample frequency never set: the header does not validate.
  const double v[1] = {0.0};
  assert(e.write_physical_samples(h, v) < 0);

  // Closing without data writes a header-only file.
  assert(e.close_file(h) == 0);
  const ParsedFile f = read_edf_file(path);
  assert(f.n_records == 0);
  assert(f.file_size == static_cast<size_t>(f.header_bytes));

  // The path is free again.
  const int h2 = e.open_file_writeonly(path.c_str(), FileType::kEdfPlus, 1);
  assert(h2 >= 0);
  assert(e.close_file(h2) == 0);

  std::filesystem::remove(path);
}

int main() {
  test_version();
  test_header_and_samples_edf();
  test_bdf_limits_and_layout();
  test_annotations_and_overflow();
  test_multiple_annotation_signals();
  test_handles_and_validation();

  std::cout << "OK\n";
  return 0;
}
