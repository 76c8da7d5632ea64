#include "edfrec/recording_writer.hpp"

#include "edfrec/header.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace edfrec {

RecordingWriter::RecordingWriter(std::string path, Header header, WriterOptions options,
                                 std::shared_ptr<CodecEngine> engine)
    : path_(std::move(path)),
      header_(std::move(header)),
      options_(std::move(options)),
      session_(std::make_shared<Session>(std::move(engine))),
      frames_(session_, options_.max_consecutive_repairs, options_.warning_handler),
      annotations_(session_) {}

RecordingWriter::~RecordingWriter() {
  try {
    session_->finish();
  } catch (const std::exception& e) {
    std::cerr << "Warning: " << e.what() << "\n";
  }
}

void RecordingWriter::open() {
  session_->open(path_, header_, options_);
}

FrameBatchReport RecordingWriter::write_frame(const Frame& frame) {
  return frames_.write_frame(frame);
}

FrameBatchReport RecordingWriter::write_frames(const std::vector<Frame>& frames) {
  return frames_.write_frames(frames);
}

void RecordingWriter::write_annotation(int64_t onset_us, int64_t duration_us,
                                       const std::string& text) {
  annotations_.write(onset_us, duration_us, text);
}

void RecordingWriter::write_annotation(const Annotation& a) {
  annotations_.write(a);
}

void RecordingWriter::write_annotations(const std::vector<Annotation>& annotations) {
  annotations_.write_all(annotations);
}

void RecordingWriter::finish() {
  session_->finish();
}

FileType RecordingWriter::file_type() const {
  return file_type_from_path(path_);
}

bool RecordingWriter::is_open() const {
  return session_->is_open();
}

} // namespace edfrec
