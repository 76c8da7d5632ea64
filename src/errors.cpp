#include "edfrec/errors.hpp"

#include <sstream>
#include <string>
#include <utility>

namespace edfrec {

WriterError::WriterError(const std::string& kind, const std::string& message,
                         std::string field, int channel, long long frame)
    : std::runtime_error(message),
      kind_(kind),
      message_(message),
      field_(std::move(field)),
      channel_(channel),
      frame_(frame) {
  rebuild_what();
}

void WriterError::set_frame(long long frame) {
  frame_ = frame;
  rebuild_what();
}

void WriterError::rebuild_what() {
  std::ostringstream oss;
  oss << kind_ << ": " << message_;
  bool any = false;
  auto sep = [&]() {
    oss << (any ? ", " : " (");
    any = true;
  };
  if (!field_.empty()) {
    sep();
    oss << "field=" << field_;
  }
  if (channel_ >= 0) {
    sep();
    oss << "channel=" << channel_;
  }
  if (frame_ >= 0) {
    sep();
    oss << "frame=" << frame_;
  }
  if (any) oss << ")";
  what_ = oss.str();
}

} // namespace edfrec
