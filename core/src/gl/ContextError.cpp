#include "hgl/gl/ContextError.hpp"

#include <cstring>

namespace hgl {

static std::string originOf(const char* file, int line) {
  // Keep only the file name; full build paths add nothing to a log line.
  const char* slash = std::strrchr(file, '/');
  std::string out = slash ? slash + 1 : file;
  out += ':';
  out += std::to_string(line);
  return out;
}

Error makeError(ErrorType type, const std::string& message,
                const char* file, int line) {
  Error e;
  e.type = type;
  e.osKind = OsErrorKind::None;
  e.message = message;
  e.origin = originOf(file, line);
  return e;
}

Error makeOsError(OsErrorKind kind, const std::string& message,
                  const char* file, int line) {
  Error e;
  e.type = ErrorType::OsError;
  e.osKind = kind;
  e.message = message;
  e.origin = originOf(file, line);
  return e;
}

const char* errorTypeName(ErrorType type) {
  switch (type) {
    case ErrorType::OsError:                return "OsError";
    case ErrorType::RobustnessNotSupported: return "RobustnessNotSupported";
    case ErrorType::BadApiUsage:            return "BadApiUsage";
  }
  return "Unknown";
}

const char* osErrorKindName(OsErrorKind kind) {
  switch (kind) {
    case OsErrorKind::None:               return "None";
    case OsErrorKind::OsMesaLoadingError: return "OsMesaLoadingError";
    case OsErrorKind::Misc:               return "Misc";
  }
  return "Unknown";
}

std::string Error::toString() const {
  std::string out = errorTypeName(type);
  if (type == ErrorType::OsError && osKind != OsErrorKind::None) {
    out += '(';
    out += osErrorKindName(osKind);
    out += ')';
  }
  if (!message.empty()) {
    out += ": ";
    out += message;
  }
  if (!origin.empty()) {
    out += " [";
    out += origin;
    out += ']';
  }
  return out;
}

} // namespace hgl
