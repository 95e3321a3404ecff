#pragma once
#include <glad/gl.h>    // GLAD must precede osmesa.h (guards GL/gl.h)

// OSMesa header uses GLAPI and APIENTRY from GL/gl.h, which GLAD suppresses.
#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif
#ifndef GLAPIENTRY
#define GLAPIENTRY APIENTRY
#endif

#include <GL/osmesa.h>
#include <string>

namespace hgl {

// The native entry points an OsMesaContext drives. The process-wide
// implementation resolves them from libOSMesa at runtime.
class OsMesaBackend {
public:
  virtual ~OsMesaBackend() = default;

  virtual OSMesaContext createContextAttribs(const int* attribList,
                                             OSMesaContext sharelist) = 0;
  virtual void destroyContext(OSMesaContext ctx) = 0;
  virtual bool makeCurrent(OSMesaContext ctx, void* buffer, GLenum type,
                           GLsizei width, GLsizei height) = 0;
  virtual OSMesaContext getCurrentContext() = 0;
  virtual OSMESAproc getProcAddress(const char* name) = 0;
};

struct OsMesaLoadResult {
  bool ok{false};
  std::string error;     // loader diagnostics when !ok
  std::string soname;    // library that satisfied the load
  OsMesaBackend* backend{nullptr};
};

// Load libOSMesa on first call and cache the outcome for the life of the
// process. Safe to call from any thread; never re-probes after the first
// attempt, whether it succeeded or not.
const OsMesaLoadResult& loadOsMesa();

} // namespace hgl
