#include "edfrec/annotation_sink.hpp"

#include <stdexcept>
#include <utility>

namespace edfrec {

AnnotationSink::AnnotationSink(std::shared_ptr<Session> session) : session_(std::move(session)) {
  if (!session_) throw std::invalid_argument("AnnotationSink: session is null");
}

void AnnotationSink::write(int64_t onset_us, int64_t duration_us, const std::string& text) {
  session_->write_annotation(onset_us, duration_us, text);
}

void AnnotationSink::write(const Annotation& a) {
  session_->write_annotation(a.onset_us, a.duration_us, a.description);
}

void AnnotationSink::write_all(const std::vector<Annotation>& annotations) {
  for (const auto& a : annotations) write(a);
}

} // namespace edfrec
