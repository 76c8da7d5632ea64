#pragma once

#include "edfrec/annotation_sink.hpp"
#include "edfrec/codec_engine.hpp"
#include "edfrec/frame_pipeline.hpp"
#include "edfrec/options.hpp"
#include "edfrec/session.hpp"
#include "edfrec/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace edfrec {

// EDF+/BDF+ recording writer.
//
// Usage:
//   RecordingWriter w("out.edf", header);
//   w.open();
//   w.write_frames(frames);
//   w.write_annotation(0, -1, "Start of recording");
//   w.finish();
//
// The file type follows the extension (.bdf -> BDF+, anything else -> EDF+).
// If finish() is not called the destructor closes the file and only logs a
// close failure.
class RecordingWriter {
public:
  RecordingWriter(std::string path, Header header, WriterOptions options = WriterOptions(),
                  std::shared_ptr<CodecEngine> engine = nullptr);
  ~RecordingWriter();

  RecordingWriter(const RecordingWriter&) = delete;
  RecordingWriter& operator=(const RecordingWriter&) = delete;

  void open();

  FrameBatchReport write_frame(const Frame& frame);
  FrameBatchReport write_frames(const std::vector<Frame>& frames);

  void write_annotation(int64_t onset_us, int64_t duration_us, const std::string& text);
  void write_annotation(const Annotation& a);
  void write_annotations(const std::vector<Annotation>& annotations);

  void finish();

  const std::string& path() const { return path_; }
  const Header& header() const { return header_; }
  const WriterOptions& options() const { return options_; }
  FileType file_type() const;
  bool is_open() const;

  std::shared_ptr<Session> session() const { return session_; }
  FramePipeline& frames() { return frames_; }
  AnnotationSink& annotations() { return annotations_; }

private:
  std::string path_;
  Header header_;
  WriterOptions options_;
  std::shared_ptr<Session> session_;
  FramePipeline frames_;
  AnnotationSink annotations_;
};

} // namespace edfrec
