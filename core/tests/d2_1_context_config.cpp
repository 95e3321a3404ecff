// D2.1 — ContextConfig JSON serialization

#include "hgl/config/ContextConfig.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: defaults serialize with every field ----
  {
    hgl::ContextConfig cfg;
    std::string json = hgl::serializeContextConfig(cfg);
    requireTrue(json.find("\"version\"") != std::string::npos, "has version");
    requireTrue(json.find("\"major\":3") != std::string::npos, "major 3");
    requireTrue(json.find("\"minor\":3") != std::string::npos, "minor 3");
    requireTrue(json.find("\"profile\":\"core\"") != std::string::npos, "profile core");
    requireTrue(json.find("\"robustness\":\"notRobust\"") != std::string::npos, "notRobust");
    requireTrue(json.find("\"width\":64") != std::string::npos, "width 64");
    requireTrue(json.find("\"height\":64") != std::string::npos, "height 64");
    std::printf("  Test 1 (serialize defaults): PASS\n");
  }

  // ---- Test 2: all fields survive a round trip ----
  {
    hgl::ContextConfig original;
    original.version = hgl::GlVersion{4, 5};
    original.profile = hgl::GlProfile::Compatibility;
    original.robustness = hgl::Robustness::TryRobustLoseContextOnReset;
    original.size = hgl::PhysicalSize{320, 200};

    hgl::ContextConfig restored;
    requireTrue(hgl::deserializeContextConfig(hgl::serializeContextConfig(original), restored),
                "deserialize ok");
    requireTrue(restored.version.major == 4 && restored.version.minor == 5, "version");
    requireTrue(restored.profile == hgl::GlProfile::Compatibility, "profile");
    requireTrue(restored.robustness == hgl::Robustness::TryRobustLoseContextOnReset, "robustness");
    requireTrue(restored.size.width == 320 && restored.size.height == 200, "size");
    std::printf("  Test 2 (round trip): PASS\n");
  }

  // ---- Test 3: missing keys keep existing values ----
  {
    hgl::ContextConfig cfg;
    requireTrue(hgl::deserializeContextConfig(R"({"profile":"unspecified","extra":true})", cfg),
                "partial ok");
    requireTrue(cfg.profile == hgl::GlProfile::Unspecified, "profile set");
    requireTrue(cfg.version.major == 3 && cfg.version.minor == 3, "version kept");
    requireTrue(cfg.size.width == 64 && cfg.size.height == 64, "size kept");
    std::printf("  Test 3 (partial): PASS\n");
  }

  // ---- Test 4: invalid input is rejected and leaves the target alone ----
  {
    const char* bad[] = {
      "not json",
      "[1,2,3]",
      R"({"profile":"es2"})",
      R"({"robustness":"always"})",
      R"({"version":{"major":300}})",
      R"({"version":{"major":-1}})",
      R"({"version":"3.3"})",
      R"({"profile":1})",
      R"({"width":0})",
      R"({"height":0})",
      R"({"width":-5})",
      R"({"height":"big"})",
      R"({"width":64.5})",
      R"({"width":4000000000})",
      R"({"width":-5,"height":"big"})"
    };
    for (const char* json : bad) {
      hgl::ContextConfig cfg;
      cfg.size = hgl::PhysicalSize{7, 9};
      requireTrue(!hgl::deserializeContextConfig(json, cfg), json);
      requireTrue(cfg.size.width == 7 && cfg.size.height == 9, "target untouched");
      requireTrue(cfg.profile == hgl::GlProfile::Core, "profile untouched");
    }
    std::printf("  Test 4 (invalid input): PASS\n");
  }

  // ---- Test 4b: largest accepted dimension ----
  {
    hgl::ContextConfig cfg;
    requireTrue(hgl::deserializeContextConfig(R"({"width":2147483647,"height":1})", cfg),
                "INT32_MAX width accepted");
    requireTrue(cfg.size.width == 2147483647u && cfg.size.height == 1, "limits kept");
    requireTrue(!hgl::deserializeContextConfig(R"({"width":2147483648})", cfg),
                "INT32_MAX + 1 rejected");
    requireTrue(cfg.size.width == 2147483647u, "target untouched after rejection");
    std::printf("  Test 4b (dimension limits): PASS\n");
  }

  // ---- Test 5: attribs() never requests sharing ----
  {
    hgl::ContextConfig cfg;
    cfg.robustness = hgl::Robustness::NoError;
    hgl::ContextAttribs a = cfg.attribs();
    requireTrue(a.sharing == nullptr, "no sharing");
    requireTrue(a.profile == hgl::GlProfile::Core, "profile copied");
    requireTrue(a.robustness == hgl::Robustness::NoError, "robustness copied");
    std::printf("  Test 5 (attribs): PASS\n");
  }

  // ---- Test 6: enum names parse back ----
  {
    hgl::Robustness r = hgl::Robustness::NotRobust;
    requireTrue(hgl::parseRobustness("robustNoResetNotification", r), "parse robustness");
    requireTrue(r == hgl::Robustness::RobustNoResetNotification, "robustness value");
    hgl::GlProfile p = hgl::GlProfile::Core;
    requireTrue(hgl::parseProfile("compatibility", p), "parse profile");
    requireTrue(p == hgl::GlProfile::Compatibility, "profile value");
    requireTrue(!hgl::parseProfile("Core", p), "names are case-sensitive");
    std::printf("  Test 6 (enum names): PASS\n");
  }

  // ---- Test 7: config file loading ----
  {
    const char* path = "d2_1_test_config.json";
    {
      std::ofstream out(path);
      out << R"({"version":{"major":2,"minor":1},"width":128,"height":32})";
    }
    hgl::ContextConfig cfg;
    requireTrue(hgl::loadContextConfigFile(path, cfg), "file loads");
    requireTrue(cfg.version.major == 2 && cfg.version.minor == 1, "file version");
    requireTrue(cfg.size.width == 128 && cfg.size.height == 32, "file size");
    std::remove(path);

    hgl::ContextConfig missing;
    requireTrue(!hgl::loadContextConfigFile("d2_1_does_not_exist.json", missing),
                "missing file fails");
    std::printf("  Test 7 (file): PASS\n");
  }

  std::printf("\nD2.1 context_config PASS\n");
  return 0;
}
