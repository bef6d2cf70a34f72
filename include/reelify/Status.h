// Reelify - Status
// Result of a pipeline stage: ok, or an error kind with the diagnostic text.

#pragma once

#include <string>
#include <utility>

namespace reelify {

enum class ErrorKind {
  None,
  Transform,      // media service failed
  Precondition,   // a required prior-stage artifact is missing
  Highlight,      // summarization or timeline formatting failed
  Transcription,  // transcription service failed
  Workspace,      // workspace directory could not be (re)created
};

const char* errorKindName(ErrorKind kind);

class Status {
public:
  Status() = default;
  Status(ErrorKind kind, std::string message)
      : kind_(kind), message_(std::move(message)) {}

  static Status Ok() { return Status(); }

  bool ok() const { return kind_ == ErrorKind::None; }
  ErrorKind kind() const { return kind_; }
  const std::string& message() const { return message_; }

  // "TransformError: <message>", or "OK".
  std::string toString() const;

private:
  ErrorKind kind_ = ErrorKind::None;
  std::string message_;
};

} // namespace reelify
