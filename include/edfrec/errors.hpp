#pragma once

#include <stdexcept>
#include <string>

namespace edfrec {

// Base class for all writer failures.
//
// Besides the message, an error records which header field, which channel
// and which frame (index within the batch passed to the frame pipeline) it
// is attributable to. Unknown channel/frame are -1.
class WriterError : public std::runtime_error {
public:
  WriterError(const std::string& kind, const std::string& message,
              std::string field = std::string(), int channel = -1, long long frame = -1);

  const std::string& kind() const { return kind_; }
  const std::string& message() const { return message_; }
  const std::string& field() const { return field_; }
  int channel() const { return channel_; }
  long long frame() const { return frame_; }

  // Attach the index of the frame being written; used by the frame pipeline
  // before rethrowing.
  void set_frame(long long frame);

  const char* what() const noexcept override { return what_.c_str(); }

private:
  void rebuild_what();

  std::string kind_;
  std::string message_;
  std::string field_;
  int channel_{-1};
  long long frame_{-1};
  std::string what_;
};

// The engine could not allocate a handle (bad path, permission, unsupported
// signal count) or the session was already opened once.
class OpenError : public WriterError {
public:
  explicit OpenError(const std::string& message)
      : WriterError("OpenError", message) {}
};

// A header field was rejected by the engine or by local pre-validation.
class ConfigError : public WriterError {
public:
  ConfigError(const std::string& field, const std::string& message, int channel = -1)
      : WriterError("ConfigError", message, field, channel) {}
};

// A sample buffer is not a whole multiple of the channel's record size, or a
// frame does not carry one buffer per channel.
class ShapeError : public WriterError {
public:
  explicit ShapeError(const std::string& message, int channel = -1, long long frame = -1)
      : WriterError("ShapeError", message, std::string(), channel, frame) {}
};

// The engine rejected a record write after shape validation passed.
class WriteError : public WriterError {
public:
  explicit WriteError(const std::string& message, int channel = -1, long long frame = -1)
      : WriterError("WriteError", message, std::string(), channel, frame) {}
};

class AnnotationError : public WriterError {
public:
  explicit AnnotationError(const std::string& message)
      : WriterError("AnnotationError", message) {}
};

class CloseError : public WriterError {
public:
  explicit CloseError(const std::string& message)
      : WriterError("CloseError", message) {}
};

// A write, annotation or setter was issued without a successfully opened and
// configured session.
class NotOpenError : public WriterError {
public:
  explicit NotOpenError(const std::string& message)
      : WriterError("NotOpenError", message) {}
};

// Setters that exist in the engine ABI but are deliberately not supported by
// this writer (birthdate, start date/time).
class UnsupportedOperation : public WriterError {
public:
  explicit UnsupportedOperation(const std::string& field)
      : WriterError("UnsupportedOperation", field + " is not implemented", field) {}
};

// Too many consecutive frames needed repair (only when a cap is configured).
class RepairLimitError : public WriterError {
public:
  RepairLimitError(const std::string& message, long long frame)
      : WriterError("RepairLimitError", message, std::string(), -1, frame) {}
};

} // namespace edfrec
