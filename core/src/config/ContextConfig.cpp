#include "hgl/config/ContextConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace hgl {

ContextAttribs ContextConfig::attribs() const {
  ContextAttribs a;
  a.profile = profile;
  a.robustness = robustness;
  a.sharing = nullptr;
  return a;
}

// -------------------- Enum names --------------------

const char* profileName(GlProfile profile) {
  switch (profile) {
    case GlProfile::Unspecified:   return "unspecified";
    case GlProfile::Core:          return "core";
    case GlProfile::Compatibility: return "compatibility";
  }
  return "unspecified";
}

const char* robustnessName(Robustness robustness) {
  switch (robustness) {
    case Robustness::NotRobust:                    return "notRobust";
    case Robustness::NoError:                      return "noError";
    case Robustness::RobustNoResetNotification:    return "robustNoResetNotification";
    case Robustness::RobustLoseContextOnReset:     return "robustLoseContextOnReset";
    case Robustness::TryRobustNoResetNotification: return "tryRobustNoResetNotification";
    case Robustness::TryRobustLoseContextOnReset:  return "tryRobustLoseContextOnReset";
  }
  return "notRobust";
}

bool parseProfile(const std::string& name, GlProfile& out) {
  static const GlProfile all[] = {
    GlProfile::Unspecified, GlProfile::Core, GlProfile::Compatibility
  };
  for (GlProfile p : all) {
    if (name == profileName(p)) { out = p; return true; }
  }
  return false;
}

bool parseRobustness(const std::string& name, Robustness& out) {
  static const Robustness all[] = {
    Robustness::NotRobust,
    Robustness::NoError,
    Robustness::RobustNoResetNotification,
    Robustness::RobustLoseContextOnReset,
    Robustness::TryRobustNoResetNotification,
    Robustness::TryRobustLoseContextOnReset
  };
  for (Robustness r : all) {
    if (name == robustnessName(r)) { out = r; return true; }
  }
  return false;
}

// -------------------- JSON --------------------

std::string serializeContextConfig(const ContextConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  rapidjson::Value ver(rapidjson::kObjectType);
  ver.AddMember("major", static_cast<unsigned>(config.version.major), alloc);
  ver.AddMember("minor", static_cast<unsigned>(config.version.minor), alloc);
  doc.AddMember("version", ver, alloc);

  doc.AddMember("profile",
                rapidjson::Value(profileName(config.profile), alloc), alloc);
  doc.AddMember("robustness",
                rapidjson::Value(robustnessName(config.robustness), alloc), alloc);
  doc.AddMember("width", config.size.width, alloc);
  doc.AddMember("height", config.size.height, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

static bool readVersionPart(const rapidjson::Value& obj, const char* key,
                            std::uint8_t& out) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsUint() || v.GetUint() > 255) return false;
  out = static_cast<std::uint8_t>(v.GetUint());
  return true;
}

// Buffer dimensions are passed to OSMesa as GLsizei and must be at least 1.
static bool readDimension(const rapidjson::Value& obj, const char* key,
                          std::uint32_t& out) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsUint()) return false;
  std::uint32_t n = v.GetUint();
  if (n == 0 || n > static_cast<std::uint32_t>(std::numeric_limits<std::int32_t>::max()))
    return false;
  out = n;
  return true;
}

bool deserializeContextConfig(const std::string& json, ContextConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  ContextConfig cfg = out;

  // Version
  if (doc.HasMember("version")) {
    const auto& ver = doc["version"];
    if (!ver.IsObject()) return false;
    if (!readVersionPart(ver, "major", cfg.version.major)) return false;
    if (!readVersionPart(ver, "minor", cfg.version.minor)) return false;
  }

  // Profile
  if (doc.HasMember("profile")) {
    if (!doc["profile"].IsString()) return false;
    if (!parseProfile(doc["profile"].GetString(), cfg.profile)) return false;
  }

  // Robustness
  if (doc.HasMember("robustness")) {
    if (!doc["robustness"].IsString()) return false;
    if (!parseRobustness(doc["robustness"].GetString(), cfg.robustness)) return false;
  }

  // Buffer size
  if (!readDimension(doc, "width", cfg.size.width)) return false;
  if (!readDimension(doc, "height", cfg.size.height)) return false;

  out = cfg;
  return true;
}

bool loadContextConfigFile(const std::string& path, ContextConfig& out) {
  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "ContextConfig: cannot open %s\n", path.c_str());
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (!deserializeContextConfig(ss.str(), out)) {
    std::fprintf(stderr, "ContextConfig: invalid config in %s\n", path.c_str());
    return false;
  }
  return true;
}

} // namespace hgl
