#pragma once

namespace hgl {

class OsMesaContext;

// Load GL entry points through GLAD using `ctx` as the resolver. `ctx` must
// be current on the calling thread. Returns GLAD's packed version
// (GLAD_VERSION_MAJOR/MINOR), or 0 on failure.
int loadGlFunctions(const OsMesaContext& ctx);

// makeNotCurrent() for hosts that report instead of unwinding: logs the
// driver's refusal to release and returns false. The context then stays
// current.
bool releaseCurrent(const OsMesaContext& ctx);

} // namespace hgl
