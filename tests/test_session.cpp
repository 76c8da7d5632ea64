#include "test_support.hpp"

#include "edfrec/errors.hpp"
#include "edfrec/session.hpp"

#include "fake_engine.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace edfrec;
using edfrec_test::EngineCall;
using edfrec_test::FakeEngine;

static Header make_header(size_t n_channels, int fs) {
  Header h;
  h.patient.name = "Demo";
  h.patient.code = "0001";
  h.patient.sex = Sex::kMale;
  h.patient.admin_code = "A1";
  h.patient.technician = "Tech";
  h.patient.equipment = "Amp";
  for (size_t i = 0; i < n_channels; ++i) {
    Channel c;
    c.label = "Ch" + std::to_string(i);
    c.transducer = "AgAgCl";
    c.physical_max = 2000.0;
    c.physical_min = -2000.0;
    c.physical_dimension = "mV";
    c.sample_frequency = fs;
    h.channels.push_back(c);
  }
  return h;
}

template <typename E, typename F>
static bool throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

static void test_setup_order() {
  auto engine = std::make_shared<FakeEngine>();
  Session s(engine);
  assert(s.state() == SessionState::kUnopened);
  s.open("rec.edf", make_header(2, 4));
  assert(s.state() == SessionState::kOpen);
  assert(s.is_writable());
  assert(s.file_type() == FileType::kEdfPlus);

  const std::vector<std::string> expected = {
      "open_file_writeonly",
      "set_equipment", "set_patientname", "set_patientcode", "set_sex", "set_admincode",
      "set_technician",
      "set_label", "set_transducer", "set_digital_maximum", "set_digital_minimum",
      "set_physical_maximum", "set_physical_minimum", "set_physical_dimension",
      "set_samplefrequency",
      "set_label", "set_transducer", "set_digital_maximum", "set_digital_minimum",
      "set_physical_maximum", "set_physical_minimum", "set_physical_dimension",
      "set_samplefrequency",
      "set_datarecord_duration"};
  assert(engine->names() == expected);

  const auto calls = engine->calls();
  assert(calls[0].signal == 2);
  assert(calls[0].text == "rec.edf");
  assert(calls[4].value == 1.0); // male
  assert(calls[15].signal == 1);
  assert(calls[15].text == "Ch1");
}

static void test_writer_level_options() {
  auto engine = std::make_shared<FakeEngine>();
  Session s(engine);
  WriterOptions opts;
  opts.annotation_signals = 2;
  opts.annotation_position = AnnotationPosition::kStart;
  opts.recording_additional = "session 1";
  s.open("rec.BDF", make_header(1, 4), opts);
  assert(s.file_type() == FileType::kBdfPlus);

  const auto names = engine->names();
  assert(names.size() >= 4);
  assert(names[names.size() - 4] == "set_datarecord_duration");
  assert(names[names.size() - 3] == "set_number_of_annotation_signals");
  assert(names[names.size() - 2] == "set_annot_chan_idx_pos");
  assert(names[names.size() - 1] == "set_recording_additional");
  assert(engine->calls_named("set_recording_additional")[0].text == "session 1");
}

static void test_open_failures() {
  {
    auto engine = std::make_shared<FakeEngine>();
    engine->open_result = -1;
    Session s(engine);
    assert(throws<OpenError>([&] { s.open("nope.edf", make_header(1, 4)); }));
    assert(s.state() == SessionState::kUnopened);
    s.finish(); // no-op
    assert(engine->count("close_file") == 0);
  }
  {
    auto engine = std::make_shared<FakeEngine>();
    Session s(engine);
    s.open("a.edf", make_header(1, 4));
    assert(throws<OpenError>([&] { s.open("b.edf", make_header(1, 4)); }));
    s.finish();
    assert(throws<OpenError>([&] { s.open("c.edf", make_header(1, 4)); }));
    assert(engine->count("open_file_writeonly") == 1);
  }
}

static void test_config_failure_leaves_handle_open() {
  auto engine = std::make_shared<FakeEngine>();
  engine->fail_on.insert("set_physical_minimum");
  Session s(engine);

  bool caught = false;
  try {
    s.open("rec.edf", make_header(3, 4));
  } catch (const ConfigError& e) {
    caught = true;
    assert(e.field() == "physical_min");
    assert(e.channel() == 0);
  }
  assert(caught);
  // No rollback: later fields were never attempted.
  assert(engine->count("set_physical_dimension") == 0);
  assert(s.state() == SessionState::kOpen);
  assert(!s.is_writable());

  assert(throws<NotOpenError>([&] { s.write_record(0, std::vector<double>(4, 0.0)); }));
  assert(throws<NotOpenError>([&] { s.write_annotation(0, -1, "x"); }));

  s.finish();
  assert(engine->count("close_file") == 1);
  assert(s.state() == SessionState::kClosed);
}

static void test_write_record_chunks() {
  auto engine = std::make_shared<FakeEngine>();
  Session s(engine);
  s.open("rec.edf", make_header(1, 4));

  std::vector<double> samples = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
  s.write_record(0, samples);
  const auto writes = engine->calls_named("write_physical_samples");
  assert(writes.size() == 3);
  assert(writes[0].samples == std::vector<double>({1, 2, 3, 4}));
  assert(writes[2].samples == std::vector<double>({9, 10, 11, 12}));

  engine->clear();
  assert(throws<ShapeError>([&] { s.write_record(0, std::vector<double>(5, 0.0)); }));
  assert(throws<ShapeError>([&] { s.write_record(0, std::vector<double>()); }));
  assert(throws<ShapeError>([&] { s.write_record(1, std::vector<double>(4, 0.0)); }));
  assert(engine->count("write_physical_samples") == 0);
}

static void test_write_record_channel_order() {
  auto engine = std::make_shared<FakeEngine>();
  Session s(engine);
  Header h = make_header(2, 4);
  h.channels[1].sample_frequency = 2;
  s.open("rec.edf", h);
  engine->clear();

  // The engine expects channel 0 first.
  assert(throws<ShapeError>([&] { s.write_record(1, std::vector<double>(2, 0.0)); }));
  // With several channels a call carries exactly one record.
  assert(throws<ShapeError>([&] { s.write_record(0, std::vector<double>(8, 0.0)); }));
  assert(engine->count("write_physical_samples") == 0);

  s.write_record(0, {1, 2, 3, 4});
  // A frame cannot start while channel 1 of this record is pending.
  assert(throws<ShapeError>([&] { s.write_frame(Frame{{1, 2, 3, 4}, {5, 6}}); }));
  assert(throws<ShapeError>([&] { s.write_record(0, {1, 2, 3, 4}); }));
  s.write_record(1, {5, 6});
  s.write_frame(Frame{{7, 8, 9, 10}, {11, 12}});

  const auto w = engine->calls_named("write_physical_samples");
  assert(w.size() == 4);
  assert(w[0].samples == std::vector<double>({1, 2, 3, 4}));
  assert(w[1].samples == std::vector<double>({5, 6}));
  assert(w[2].samples == std::vector<double>({7, 8, 9, 10}));
  assert(w[3].samples == std::vector<double>({11, 12}));
}

static void test_write_frame_multiple_records() {
  auto engine = std::make_shared<FakeEngine>();
  Session s(engine);
  Header h = make_header(2, 2);
  h.channels[1].sample_frequency = 3;
  s.open("rec.edf", h);
  engine->clear();

  // Two records per channel are written record by record.
  s.write_frame(Frame{{1, 2, 3, 4}, {5, 6, 7, 8, 9, 10}});
  auto w = engine->calls_named("write_physical_samples");
  assert(w.size() == 4);
  assert(w[0].signal == 0 && w[0].samples == std::vector<double>({1, 2}));
  assert(w[1].signal == 1 && w[1].samples == std::vector<double>({5, 6, 7}));
  assert(w[2].signal == 0 && w[2].samples == std::vector<double>({3, 4}));
  assert(w[3].signal == 1 && w[3].samples == std::vector<double>({8, 9, 10}));

  // Channels disagreeing on the record count are rejected up front.
  engine->clear();
  bool caught = false;
  try {
    s.write_frame(Frame{{1, 2, 3, 4}, {5, 6, 7}});
  } catch (const ShapeError& e) {
    caught = true;
    assert(e.channel() == 1);
  }
  assert(caught);
  assert(engine->count("write_physical_samples") == 0);
}

static void test_write_failure_stops_sample_writes() {
  auto engine = std::make_shared<FakeEngine>();
  Session s(engine);
  s.open("rec.edf", make_header(2, 2));
  engine->fail_on.insert("write_physical_samples");
  assert(throws<WriteError>([&] { s.write_frame(Frame{{1.0, 2.0}, {3.0, 4.0}}); }));
  assert(!s.is_writable());
  assert(s.is_open());

  engine->fail_on.clear();
  engine->clear();
  assert(throws<NotOpenError>([&] { s.write_frame(Frame{{1.0, 2.0}, {3.0, 4.0}}); }));
  assert(throws<NotOpenError>([&] { s.write_record(0, {1.0, 2.0}); }));
  assert(engine->count("write_physical_samples") == 0);
  // Annotations do not depend on the record position.
  s.write_annotation(0, -1, "still accepted");
  assert(engine->count("write_annotation_latin1") == 1);
  s.finish();
  assert(engine->count("close_file") == 1);
}

static void test_write_frame_and_failures() {
  auto engine = std::make_shared<FakeEngine>();
  Session s(engine);
  s.open("rec.edf", make_header(2, 2));

  s.write_frame(Frame{{1.0, 2.0}, {3.0, 4.0}});
  assert(engine->count("write_physical_samples") == 2);

  // Shape errors are detected before any channel is written.
  engine->clear();
  assert(throws<ShapeError>([&] { s.write_frame(Frame{{1.0, 2.0}, {3.0}}); }));
  assert(throws<ShapeError>([&] { s.write_frame(Frame{{1.0, 2.0}}); }));
  assert(engine->count("write_physical_samples") == 0);

  engine->fail_on.insert("write_physical_samples");
  bool caught = false;
  try {
    s.write_frame(Frame{{1.0, 2.0}, {3.0, 4.0}});
  } catch (const WriteError& e) {
    caught = true;
    assert(e.channel() == 0);
  }
  assert(caught);

  engine->fail_on.insert("write_annotation_latin1");
  assert(throws<AnnotationError>([&] { s.write_annotation(0, -1, "x"); }));
}

static void test_annotation_latin1_boundary() {
  auto engine = std::make_shared<FakeEngine>();
  Session s(engine);
  s.open("rec.edf", make_header(1, 2));
  s.write_annotation(1500000, -1, "M\xC3\xBCller \xE2\x82\xAC");
  const auto a = engine->calls_named("write_annotation_latin1");
  assert(a.size() == 1);
  assert(a[0].onset == 1500000);
  assert(a[0].duration == -1);
  assert(a[0].text == "M\xFCller ?");
}

static void test_setters_and_lifecycle() {
  auto engine = std::make_shared<FakeEngine>();
  Session s(engine);

  assert(throws<NotOpenError>([&] { s.set_patient_name("x"); }));
  assert(throws<UnsupportedOperation>([&] { s.set_birthdate(1990, 1, 1); }));
  assert(throws<UnsupportedOperation>([&] { s.set_start_datetime(2024, 1, 1, 12, 0, 0); }));

  s.open("rec.edf", make_header(2, 4));
  engine->clear();

  s.set_patient_name("Other");
  s.set_sample_frequency(1, 8);
  assert(s.header().channels[1].sample_frequency == 8);
  s.set_label(0, "Fp1");
  assert(engine->calls_named("set_label")[0].text == "Fp1");
  assert(throws<ConfigError>([&] { s.set_label(5, "x"); }));
  assert(throws<ConfigError>([&] { s.set_record_duration(std::chrono::seconds(120)); }));

  engine->fail_on.insert("set_technician");
  bool caught = false;
  try {
    s.set_technician("T");
  } catch (const ConfigError& e) {
    caught = true;
    assert(e.field() == "technician");
    assert(std::string(e.what()).find("technician") != std::string::npos);
  }
  assert(caught);

  s.finish();
  s.finish();
  assert(engine->count("close_file") == 1);
  assert(throws<NotOpenError>([&] { s.write_annotation(0, -1, "late"); }));
  assert(throws<NotOpenError>([&] { s.set_equipment("late"); }));
}

static void test_close_failure() {
  auto engine = std::make_shared<FakeEngine>();
  engine->fail_on.insert("close_file");
  Session s(engine);
  s.open("rec.edf", make_header(1, 4));
  assert(throws<CloseError>([&] { s.finish(); }));
  assert(s.state() == SessionState::kClosed);
  s.finish();
  assert(engine->count("close_file") == 1);
}

static void test_destructor_closes() {
  auto engine = std::make_shared<FakeEngine>();
  {
    Session s(engine);
    s.open("rec.edf", make_header(1, 4));
  }
  assert(engine->count("close_file") == 1);
}

int main() {
  test_setup_order();
  test_writer_level_options();
  test_open_failures();
  test_config_failure_leaves_handle_open();
  test_write_record_chunks();
  test_write_record_channel_order();
  test_write_frame_multiple_records();
  test_write_failure_stops_sample_writes();
  test_write_frame_and_failures();
  test_annotation_latin1_boundary();
  test_setters_and_lifecycle();
  test_close_failure();
  test_destructor_closes();

  std::cout << "OK\n";
  return 0;
}
