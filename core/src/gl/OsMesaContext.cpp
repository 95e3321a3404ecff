#include "hgl/gl/OsMesaContext.hpp"
#include "hgl/gl/OsMesaBuffer.hpp"

#include <cstdio>
#include <cstdlib>

#define MAKE_ERROR(type, msg) makeError((type), (msg), __FILE__, __LINE__)
#define MAKE_OS_ERROR(kind, msg) makeOsError((kind), (msg), __FILE__, __LINE__)

namespace hgl {

std::vector<int> buildAttribList(GlProfile profile, GlVersion version) {
  std::vector<int> attribs;

  switch (profile) {
    case GlProfile::Core:
      attribs.push_back(OSMESA_PROFILE);
      attribs.push_back(OSMESA_CORE_PROFILE);
      break;
    case GlProfile::Compatibility:
      attribs.push_back(OSMESA_PROFILE);
      attribs.push_back(OSMESA_COMPAT_PROFILE);
      break;
    case GlProfile::Unspecified:
      break;
  }

  attribs.push_back(OSMESA_CONTEXT_MAJOR_VERSION);
  attribs.push_back(static_cast<int>(version.major));
  attribs.push_back(OSMESA_CONTEXT_MINOR_VERSION);
  attribs.push_back(static_cast<int>(version.minor));

  attribs.push_back(0);
  return attribs;
}

ContextResult OsMesaContext::create(const ContextAttribs& attribs, GlVersion version) {
  return create(loadOsMesa(), attribs, version);
}

ContextResult OsMesaContext::create(const OsMesaLoadResult& lib,
                                    const ContextAttribs& attribs,
                                    GlVersion version) {
  if (!lib.ok || !lib.backend) {
    ContextResult r;
    r.ok = false;
    r.err = MAKE_OS_ERROR(OsErrorKind::OsMesaLoadingError, lib.error);
    return r;
  }
  return create(*lib.backend, attribs, version);
}

ContextResult OsMesaContext::create(OsMesaBackend& backend,
                                    const ContextAttribs& attribs,
                                    GlVersion version) {
  ContextResult r;

  if (attribs.sharing) {
    std::fprintf(stderr, "OsMesaContext: context sharing not possible with OSMesa\n");
    std::abort();
  }

  if (attribs.robustness == Robustness::RobustNoResetNotification ||
      attribs.robustness == Robustness::RobustLoseContextOnReset) {
    r.ok = false;
    r.err = MAKE_ERROR(ErrorType::RobustnessNotSupported,
                           "OSMesa cannot guarantee reset robustness");
    return r;
  }

  const std::vector<int> attribList = buildAttribList(attribs.profile, version);

  OSMesaContext ctx = backend.createContextAttribs(attribList.data(), nullptr);
  if (!ctx) {
    std::fprintf(stderr, "OsMesaContext: OSMesaCreateContextAttribs failed (GL %u.%u)\n",
                 static_cast<unsigned>(version.major), static_cast<unsigned>(version.minor));
    r.ok = false;
    r.err = MAKE_OS_ERROR(OsErrorKind::Misc, "OSMesaCreateContextAttribs failed");
    return r;
  }

  r.context.reset(new OsMesaContext(backend, ctx));
  return r;
}

OsMesaContext::OsMesaContext(OsMesaBackend& backend, OSMesaContext ctx)
  : backend_(backend), ctx_(ctx) {}

OsMesaContext::~OsMesaContext() {
  backend_.destroyContext(ctx_);
  ctx_ = nullptr;
}

void OsMesaContext::makeCurrent(OsMesaBuffer& buffer) const {
  bool ok = backend_.makeCurrent(ctx_, buffer.data(), GL_UNSIGNED_BYTE,
                                 static_cast<GLsizei>(buffer.width()),
                                 static_cast<GLsizei>(buffer.height()));
  // Only invalid parameters make this fail, and those come from us.
  if (!ok) {
    std::fprintf(stderr, "OsMesaContext: OSMesaMakeCurrent failed (%ux%u)\n",
                 buffer.width(), buffer.height());
    std::abort();
  }
}

void OsMesaContext::makeNotCurrent() const {
  if (backend_.getCurrentContext() != ctx_) return;

  // Older gallium-based drivers reject a null context here. There is no way
  // to detect them up front.
  if (!backend_.makeCurrent(nullptr, nullptr, 0, 0, 0)) {
    throw UnsupportedOperation(
      "OSMesaMakeCurrent failed to make the context not current; "
      "this most likely means an older gallium-based Mesa driver");
  }
}

bool OsMesaContext::isCurrent() const {
  return backend_.getCurrentContext() == ctx_;
}

ProcResult OsMesaContext::getProcAddress(const std::string& name) const {
  ProcResult r;
  if (name.find('\0') != std::string::npos) {
    r.ok = false;
    r.err = MAKE_ERROR(ErrorType::BadApiUsage,
                       "getProcAddress name contains an embedded NUL");
    return r;
  }
#if HGL_CHECK_CURRENT_CONTEXT
  if (!isCurrent()) {
    r.ok = false;
    r.err = MAKE_ERROR(ErrorType::BadApiUsage,
                           "getProcAddress called on context that is not current");
    return r;
  }
#endif
  r.address = backend_.getProcAddress(name.c_str());
  return r;
}

} // namespace hgl
