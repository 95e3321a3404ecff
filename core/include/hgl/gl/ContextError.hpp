#pragma once
#include <stdexcept>
#include <string>

namespace hgl {

enum class ErrorType {
  OsError,
  RobustnessNotSupported,
  BadApiUsage
};

enum class OsErrorKind {
  None,
  OsMesaLoadingError,
  Misc
};

struct Error {
  ErrorType type{ErrorType::OsError};
  OsErrorKind osKind{OsErrorKind::None};
  std::string message;  // human text
  std::string origin;   // "file:line" of the producing site

  std::string toString() const;
};

Error makeError(ErrorType type, const std::string& message,
                const char* file, int line);
Error makeOsError(OsErrorKind kind, const std::string& message,
                  const char* file, int line);

const char* errorTypeName(ErrorType type);
const char* osErrorKindName(OsErrorKind kind);

// Raised when the loaded driver cannot perform an operation this layer
// has no fallback for (e.g. releasing the current context on old gallium).
class UnsupportedOperation : public std::runtime_error {
public:
  explicit UnsupportedOperation(const std::string& what)
    : std::runtime_error(what) {}
};

} // namespace hgl
