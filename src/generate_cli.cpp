#include "edfrec/header.hpp"
#include "edfrec/recording_writer.hpp"
#include "edfrec/types.hpp"
#include "edfrec/utils.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace edfrec;

namespace {

struct Args {
  std::string output_path;
  double seconds{10.0};
  int fs{256};
  std::vector<double> freqs{20.0, 50.0};
  double amplitude{1000.0};
  std::string unit{"mV"};
  double record_duration_seconds{1.0};
  std::string patient_name{"Demo"};
  std::string patient_code{"0001"};
  std::string technician{"edfrec"};
  std::string equipment{"edfrec"};
  bool annotations{true};
};

static void print_help() {
  std::cout
      << "edfrec_generate_cli\n\n"
      << "Write a synthetic sine-wave recording as EDF+ (16-bit) or BDF+ (24-bit).\n"
      << "One channel is written per frequency; the file type follows the output extension.\n\n"
      << "Usage:\n"
      << "  edfrec_generate_cli --output <out.edf|out.bdf> [options]\n\n"
      << "Options:\n"
      << "  --seconds <N>              Recording length in seconds (default 10).\n"
      << "  --fs <Hz>                  Sampling rate (default 256).\n"
      << "  --freqs <f1,f2,...>        Sine frequencies in Hz, one channel each (default 20,50).\n"
      << "  --amplitude <X>            Sine amplitude in physical units (default 1000).\n"
      << "  --unit <text>              Physical dimension (default mV).\n"
      << "  --record-duration <sec>    Data record duration, 0.001 .. 60 (default 1.0).\n"
      << "                             fs * record-duration must be a whole number.\n"
      << "  --patient-name <text>      Patient name (default 'Demo').\n"
      << "  --patient-code <text>      Patient code (default '0001').\n"
      << "  --technician <text>        Technician (default 'edfrec').\n"
      << "  --equipment <text>         Equipment (default 'edfrec').\n"
      << "  --no-annotations           Do not write start/end annotations.\n"
      << "  -h, --help                 Show this help.\n";
}

static bool is_flag(const std::string& a, const char* s1, const char* s2 = nullptr) {
  if (a == s1) return true;
  if (s2 && a == s2) return true;
  return false;
}

static std::string require_value(int& i, int argc, char** argv, const std::string& flag) {
  if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
  return std::string(argv[++i]);
}

static std::vector<double> parse_freqs(const std::string& s) {
  std::vector<double> out;
  for (const auto& part : split(s, ',')) {
    const std::string t = trim(part);
    if (t.empty()) continue;
    const double f = to_double(t);
    if (!(f > 0.0)) throw std::runtime_error("--freqs: frequencies must be > 0");
    out.push_back(f);
  }
  if (out.empty()) throw std::runtime_error("--freqs: expected at least one frequency");
  return out;
}

static std::string freq_label(double f) {
  std::string s = std::to_string(f);
  if (s.find('.') != std::string::npos) {
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
  }
  return "Sine" + s + "Hz";
}

} // namespace

int main(int argc, char** argv) {
  try {
    Args args;

    if (argc <= 1) {
      print_help();
      return 1;
    }

    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];

      if (is_flag(a, "-h", "--help")) {
        print_help();
        return 0;
      } else if (is_flag(a, "--output", "-o")) {
        args.output_path = require_value(i, argc, argv, a);
      } else if (a == "--seconds") {
        args.seconds = to_double(require_value(i, argc, argv, a));
      } else if (a == "--fs") {
        args.fs = to_int(require_value(i, argc, argv, a));
      } else if (a == "--freqs") {
        args.freqs = parse_freqs(require_value(i, argc, argv, a));
      } else if (a == "--amplitude") {
        args.amplitude = to_double(require_value(i, argc, argv, a));
      } else if (a == "--unit") {
        args.unit = require_value(i, argc, argv, a);
      } else if (a == "--record-duration") {
        args.record_duration_seconds = to_double(require_value(i, argc, argv, a));
      } else if (a == "--patient-name") {
        args.patient_name = require_value(i, argc, argv, a);
      } else if (a == "--patient-code") {
        args.patient_code = require_value(i, argc, argv, a);
      } else if (a == "--technician") {
        args.technician = require_value(i, argc, argv, a);
      } else if (a == "--equipment") {
        args.equipment = require_value(i, argc, argv, a);
      } else if (a == "--no-annotations") {
        args.annotations = false;
      } else {
        throw std::runtime_error("Unknown argument: " + a);
      }
    }

    if (args.output_path.empty()) {
      throw std::runtime_error("Missing required argument --output");
    }
    if (args.fs <= 0) throw std::runtime_error("--fs must be > 0");
    if (!(args.seconds > 0.0)) throw std::runtime_error("--seconds must be > 0");
    if (!(args.amplitude > 0.0)) throw std::runtime_error("--amplitude must be > 0");

    const double spr_d = static_cast<double>(args.fs) * args.record_duration_seconds;
    const long long spr = std::llround(spr_d);
    if (spr < 1 || std::fabs(spr_d - static_cast<double>(spr)) > 1e-6) {
      throw std::runtime_error("fs * record-duration must be a positive whole number of samples");
    }
    const long long n_records =
        std::llround(std::ceil(args.seconds / args.record_duration_seconds - 1e-9));

    Header header;
    header.patient.name = args.patient_name;
    header.patient.code = args.patient_code;
    header.patient.sex = Sex::kFemale;
    header.patient.admin_code = args.patient_code;
    header.patient.technician = args.technician;
    header.patient.equipment = args.equipment;
    for (double f : args.freqs) {
      Channel c;
      c.label = freq_label(f);
      c.transducer = "AgAgCl cup electrodes";
      c.physical_max = 2.0 * args.amplitude;
      c.physical_min = -2.0 * args.amplitude;
      c.physical_dimension = args.unit;
      c.sample_frequency = static_cast<int>(spr);
      // Use the container's full digital range.
      if (file_type_from_path(args.output_path) == FileType::kBdfPlus) {
        c.digital_max = 8388607;
        c.digital_min = -8388608;
      }
      header.channels.push_back(c);
    }

    WriterOptions opts;
    opts.record_duration = std::chrono::microseconds(
        std::llround(args.record_duration_seconds * 1e6));

    RecordingWriter out(args.output_path, header, opts);
    out.open();

    const double pi = 3.14159265358979323846;
    std::vector<Frame> frames;
    frames.reserve(static_cast<size_t>(n_records));
    for (long long r = 0; r < n_records; ++r) {
      Frame frame(args.freqs.size(), std::vector<double>(static_cast<size_t>(spr)));
      for (size_t ch = 0; ch < args.freqs.size(); ++ch) {
        for (long long i = 0; i < spr; ++i) {
          const double t = static_cast<double>(r * spr + i) / static_cast<double>(args.fs);
          frame[ch][static_cast<size_t>(i)] = std::sin(2.0 * pi * args.freqs[ch] * t) * args.amplitude;
        }
      }
      frames.push_back(std::move(frame));
    }
    const FrameBatchReport report = out.write_frames(frames);

    if (args.annotations) {
      const int64_t end_us =
          static_cast<int64_t>(n_records) * static_cast<int64_t>(opts.record_duration.count());
      out.write_annotation(0, 0, "Start of recording");
      out.write_annotation(end_us, 0, "End of recording");
    }

    out.finish();

    std::cout << "Wrote " << file_type_name(out.file_type()) << ": " << args.output_path << " ("
              << report.frames_written << " records, " << args.freqs.size() << " channels)\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
