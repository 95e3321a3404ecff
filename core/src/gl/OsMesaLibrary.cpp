#include "hgl/gl/OsMesaLibrary.hpp"

#include <dlfcn.h>
#include <cstdio>

namespace hgl {

namespace {

using CreateContextAttribsFn = decltype(&OSMesaCreateContextAttribs);
using DestroyContextFn       = decltype(&OSMesaDestroyContext);
using MakeCurrentFn          = decltype(&OSMesaMakeCurrent);
using GetCurrentContextFn    = decltype(&OSMesaGetCurrentContext);
using GetProcAddressFn       = decltype(&OSMesaGetProcAddress);

const char* const kSonames[] = {
  "libOSMesa.so.8",
  "libOSMesa.so.6",
  "libOSMesa.so",
};

class DlOsMesaBackend : public OsMesaBackend {
public:
  explicit DlOsMesaBackend(void* lib) : lib_(lib) {}

  // Resolve every entry point. Returns the first missing symbol, or nullptr.
  const char* resolve() {
    if (!bind(createContextAttribs_, "OSMesaCreateContextAttribs")) return "OSMesaCreateContextAttribs";
    if (!bind(destroyContext_, "OSMesaDestroyContext")) return "OSMesaDestroyContext";
    if (!bind(makeCurrent_, "OSMesaMakeCurrent")) return "OSMesaMakeCurrent";
    if (!bind(getCurrentContext_, "OSMesaGetCurrentContext")) return "OSMesaGetCurrentContext";
    if (!bind(getProcAddress_, "OSMesaGetProcAddress")) return "OSMesaGetProcAddress";
    return nullptr;
  }

  OSMesaContext createContextAttribs(const int* attribList,
                                     OSMesaContext sharelist) override {
    return createContextAttribs_(attribList, sharelist);
  }

  void destroyContext(OSMesaContext ctx) override {
    destroyContext_(ctx);
  }

  bool makeCurrent(OSMesaContext ctx, void* buffer, GLenum type,
                   GLsizei width, GLsizei height) override {
    return makeCurrent_(ctx, buffer, type, width, height) != 0;
  }

  OSMesaContext getCurrentContext() override {
    return getCurrentContext_();
  }

  OSMESAproc getProcAddress(const char* name) override {
    return getProcAddress_(name);
  }

private:
  template <typename Fn>
  bool bind(Fn& slot, const char* name) {
    slot = reinterpret_cast<Fn>(dlsym(lib_, name));
    return slot != nullptr;
  }

  void* lib_{nullptr};
  CreateContextAttribsFn createContextAttribs_{nullptr};
  DestroyContextFn destroyContext_{nullptr};
  MakeCurrentFn makeCurrent_{nullptr};
  GetCurrentContextFn getCurrentContext_{nullptr};
  GetProcAddressFn getProcAddress_{nullptr};
};

OsMesaLoadResult tryLoading() {
  OsMesaLoadResult r;
  std::string diagnostics;

  for (const char* soname : kSonames) {
    void* lib = dlopen(soname, RTLD_NOW | RTLD_LOCAL);
    if (!lib) {
      const char* why = dlerror();
      if (!diagnostics.empty()) diagnostics += "; ";
      diagnostics += why ? why : soname;
      continue;
    }

    // Never freed: contexts destroyed during static teardown still need it.
    auto* candidate = new DlOsMesaBackend(lib);
    if (const char* missing = candidate->resolve()) {
      if (!diagnostics.empty()) diagnostics += "; ";
      diagnostics += soname;
      diagnostics += ": missing symbol ";
      diagnostics += missing;
      delete candidate;
      dlclose(lib);
      continue;
    }

    r.ok = true;
    r.soname = soname;
    r.backend = candidate;
    std::fprintf(stderr, "[OsMesaLibrary] loaded %s\n", soname);
    return r;
  }

  r.error = diagnostics.empty() ? "no OSMesa library candidates" : diagnostics;
  std::fprintf(stderr, "[OsMesaLibrary] load failed: %s\n", r.error.c_str());
  return r;
}

} // namespace

const OsMesaLoadResult& loadOsMesa() {
  static const OsMesaLoadResult result = tryLoading();
  return result;
}

} // namespace hgl
