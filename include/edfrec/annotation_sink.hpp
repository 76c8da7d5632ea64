#pragma once

#include "edfrec/session.hpp"
#include "edfrec/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace edfrec {

// Forwards annotations to a shared Session as they arrive (no batching, no
// ordering checks).
class AnnotationSink {
public:
  explicit AnnotationSink(std::shared_ptr<Session> session);

  void write(int64_t onset_us, int64_t duration_us, const std::string& text);
  void write(const Annotation& a);
  // Stops at the first failure.
  void write_all(const std::vector<Annotation>& annotations);

private:
  std::shared_ptr<Session> session_;
};

} // namespace edfrec
