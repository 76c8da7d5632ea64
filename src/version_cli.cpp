#include "edfrec/version.hpp"

#include "edfrec/codec_engine.hpp"
#include "edfrec/edf_codec_engine.hpp"
#include "edfrec/header.hpp"
#include "edfrec/tal.hpp"
#include "edfrec/utils.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace edfrec;

namespace {

enum class OutputMode { kShort, kFull, kJson };

struct Args {
  OutputMode mode{OutputMode::kShort};
  bool help{false};
};

// What the built-in engine writes for one container type.
struct ContainerInfo {
  FileType type{FileType::kEdfPlus};
  std::string extension;
  int bytes_per_sample{0};
  int digital_min{0};
  int digital_max{0};
  std::string annotation_label;
  int annotation_samples{0};
};

static std::vector<ContainerInfo> supported_containers() {
  std::vector<ContainerInfo> out;
  for (FileType t : {FileType::kEdfPlus, FileType::kBdfPlus}) {
    ContainerInfo c;
    c.type = t;
    c.extension = t == FileType::kBdfPlus ? ".bdf" : ".edf";
    c.bytes_per_sample = bytes_per_sample(t);
    c.digital_min = digital_limit_min(t);
    c.digital_max = digital_limit_max(t);
    c.annotation_label = annotation_signal_label(t);
    c.annotation_samples = EdfCodecEngine::kAnnotationSlotBytes / c.bytes_per_sample;
    out.push_back(c);
  }
  return out;
}

static std::string seconds_from_ticks(int64_t ticks) {
  return format_tal_duration(ticks * kMicrosecondsPerTick);
}

static void print_help() {
  std::cout
      << "edfrec_version_cli\n\n"
      << "Report the edfrec version, the codec engine and the containers it writes.\n\n"
      << "Usage:\n"
      << "  edfrec_version_cli [--full | --json]\n\n"
      << "Options:\n"
      << "  --full          Engine limits, container table and build details\n"
      << "  --json          Same content as one JSON object\n"
      << "  -h, --help      Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      a.help = true;
    } else if (arg == "--full") {
      a.mode = OutputMode::kFull;
    } else if (arg == "--json") {
      a.mode = OutputMode::kJson;
    } else {
      throw std::runtime_error("Unknown argument: " + arg);
    }
  }
  return a;
}

static void print_full(const std::vector<ContainerInfo>& containers) {
  std::cout << "edfrec " << version_string() << "\n"
            << "engine " << codec_engine_version_string() << " (" << codec_engine_version() << ")\n"
            << "  open files:          " << EdfCodecEngine::kMaxFiles << "\n"
            << "  data signals/file:   " << EdfCodecEngine::kMaxSignals << "\n"
            << "  annotation signals:  1 .. " << EdfCodecEngine::kMaxAnnotationSignals << "\n"
            << "  record duration:     " << seconds_from_ticks(kMinRecordDurationTicks) << " .. "
            << seconds_from_ticks(kMaxRecordDurationTicks) << " s\n"
            << "  annotation text:     " << kMaxAnnotationTextBytes << " bytes\n";

  for (const auto& c : containers) {
    std::cout << file_type_name(c.type) << " (" << c.extension << ")\n"
              << "  sample width:        " << (8 * c.bytes_per_sample) << " bit\n"
              << "  digital range:       " << c.digital_min << " .. " << c.digital_max << "\n"
              << "  annotation signal:   '" << c.annotation_label << "', " << c.annotation_samples
              << " samples/record\n";
  }

  std::cout << "build " << build_type_string() << ", " << compiler_string() << ", "
            << cpp_standard_string() << "\n";
}

static void print_json(const std::vector<ContainerInfo>& containers) {
  std::ostringstream js;
  js << "{\"version\":\"" << json_escape(version_string()) << "\""
     << ",\"engine\":{\"version\":" << codec_engine_version()
     << ",\"version_string\":\"" << json_escape(codec_engine_version_string()) << "\""
     << ",\"max_open_files\":" << EdfCodecEngine::kMaxFiles
     << ",\"max_signals\":" << EdfCodecEngine::kMaxSignals
     << ",\"max_annotation_signals\":" << EdfCodecEngine::kMaxAnnotationSignals
     << ",\"record_duration_us\":[" << kMinRecordDurationTicks * kMicrosecondsPerTick << ","
     << kMaxRecordDurationTicks * kMicrosecondsPerTick << "]"
     << ",\"max_annotation_text_bytes\":" << kMaxAnnotationTextBytes << "}"
     << ",\"containers\":[";
  for (size_t i = 0; i < containers.size(); ++i) {
    const ContainerInfo& c = containers[i];
    if (i > 0) js << ",";
    js << "{\"type\":\"" << json_escape(file_type_name(c.type)) << "\""
       << ",\"extension\":\"" << json_escape(c.extension) << "\""
       << ",\"bytes_per_sample\":" << c.bytes_per_sample
       << ",\"digital_min\":" << c.digital_min
       << ",\"digital_max\":" << c.digital_max
       << ",\"annotation_label\":\"" << json_escape(c.annotation_label) << "\""
       << ",\"annotation_samples\":" << c.annotation_samples << "}";
  }
  js << "]"
     << ",\"build\":{\"type\":\"" << json_escape(build_type_string()) << "\""
     << ",\"compiler\":\"" << json_escape(compiler_string()) << "\""
     << ",\"cpp_standard\":\"" << json_escape(cpp_standard_string()) << "\"}}";
  std::cout << js.str() << "\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args a = parse_args(argc, argv);
    if (a.help) {
      print_help();
      return 0;
    }

    switch (a.mode) {
      case OutputMode::kShort:
        std::cout << "edfrec " << version_string() << " (engine "
                  << codec_engine_version_string() << ")\n";
        break;
      case OutputMode::kFull:
        print_full(supported_containers());
        break;
      case OutputMode::kJson:
        print_json(supported_containers());
        break;
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
