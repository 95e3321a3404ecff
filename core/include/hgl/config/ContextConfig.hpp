#pragma once
#include "hgl/gl/ContextTypes.hpp"

#include <string>

namespace hgl {

// Serializable description of a headless context + buffer pair.
struct ContextConfig {
  GlVersion version{3, 3};
  GlProfile profile{GlProfile::Core};
  Robustness robustness{Robustness::NotRobust};
  PhysicalSize size{64, 64};

  // Creation preferences; never requests sharing.
  ContextAttribs attribs() const;
};

const char* profileName(GlProfile profile);
const char* robustnessName(Robustness robustness);

// Parse the names produced above. Return false for unknown names.
bool parseProfile(const std::string& name, GlProfile& out);
bool parseRobustness(const std::string& name, Robustness& out);

// Serialize ContextConfig to a JSON string.
std::string serializeContextConfig(const ContextConfig& config);

// Deserialize a JSON string into ContextConfig. Missing keys keep the value
// already in `out`. Returns false (leaving `out` untouched) on malformed
// JSON, a non-object root, an unknown profile/robustness name, an
// out-of-range version component, or a width/height that is not an
// unsigned integer in [1, INT32_MAX].
bool deserializeContextConfig(const std::string& json, ContextConfig& out);

// Read and deserialize a config file. Returns false if the file cannot be
// read or does not parse.
bool loadContextConfigFile(const std::string& path, ContextConfig& out);

} // namespace hgl
