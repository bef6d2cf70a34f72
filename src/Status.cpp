#include "reelify/Status.h"

namespace reelify {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "OK";
    case ErrorKind::Transform: return "TransformError";
    case ErrorKind::Precondition: return "PreconditionError";
    case ErrorKind::Highlight: return "HighlightError";
    case ErrorKind::Transcription: return "TranscriptionError";
    case ErrorKind::Workspace: return "WorkspaceError";
  }
  return "UnknownError";
}

std::string Status::toString() const {
  if (ok()) return "OK";
  std::string out = errorKindName(kind_);
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

} // namespace reelify
