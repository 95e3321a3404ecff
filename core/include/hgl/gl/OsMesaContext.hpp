#pragma once
#include "hgl/gl/ContextError.hpp"
#include "hgl/gl/ContextTypes.hpp"
#include "hgl/gl/OsMesaLibrary.hpp"

#include <memory>
#include <string>
#include <vector>

#ifndef HGL_CHECK_CURRENT_CONTEXT
#  ifdef NDEBUG
#    define HGL_CHECK_CURRENT_CONTEXT 0
#  else
#    define HGL_CHECK_CURRENT_CONTEXT 1
#  endif
#endif

namespace hgl {

class OsMesaBuffer;

struct ContextResult;

struct ProcResult {
  bool ok{true};
  Error err{};
  OSMESAproc address{nullptr};  // null when the symbol is unknown
};

// Zero-terminated OSMESA_* attribute list for OSMesaCreateContextAttribs.
// The profile pair is omitted for GlProfile::Unspecified; the version pairs
// are always present.
std::vector<int> buildAttribList(GlProfile profile, GlVersion version);

// Off-screen GL context backed by OSMesa.
//
// "Current" is a per-thread slot owned by the driver. A context must not be
// current on two threads at once, and the buffer passed to makeCurrent()
// must outlive the binding. Neither is checked here; callers of
// makeCurrent()/makeNotCurrent() own that synchronisation.
//
// isCurrent() and getProcAddress() only read the calling thread's slot and
// may be called on a shared context from any thread.
class OsMesaContext {
public:
  // Loads libOSMesa (once per process) and creates a context.
  static ContextResult create(const ContextAttribs& attribs, GlVersion version);

  // Creates a context from an already attempted library load. A failed
  // load becomes OsError(OsMesaLoadingError) carrying the loader's message.
  static ContextResult create(const OsMesaLoadResult& lib,
                              const ContextAttribs& attribs,
                              GlVersion version);

  // Creates a context on an explicit backend.
  static ContextResult create(OsMesaBackend& backend,
                              const ContextAttribs& attribs,
                              GlVersion version);

  ~OsMesaContext();

  OsMesaContext(const OsMesaContext&) = delete;
  OsMesaContext& operator=(const OsMesaContext&) = delete;

  // Bind this context to `buffer` as GL_UNSIGNED_BYTE RGBA on the calling
  // thread. Aborts if the driver rejects the parameters.
  void makeCurrent(OsMesaBuffer& buffer) const;

  // Release the calling thread's binding if it is this context; no-op
  // otherwise. Throws UnsupportedOperation when the driver cannot release.
  void makeNotCurrent() const;

  bool isCurrent() const;

  // Native OSMesaContext, valid for the lifetime of this object.
  void* rawHandle() const { return ctx_; }

  // Names containing an embedded NUL are rejected as BadApiUsage.
  ProcResult getProcAddress(const std::string& name) const;

  static constexpr bool checksCurrentContext() { return HGL_CHECK_CURRENT_CONTEXT != 0; }

private:
  OsMesaContext(OsMesaBackend& backend, OSMesaContext ctx);

  OsMesaBackend& backend_;
  OSMesaContext ctx_{nullptr};
};

struct ContextResult {
  bool ok{true};
  Error err{};
  std::unique_ptr<OsMesaContext> context;
};

} // namespace hgl
