#pragma once
#include "logger.hpp"
#include "tinyjson.hpp"
#include "types.hpp"
#include "uia_provider.hpp"
#include <string>

namespace uiscope {

struct Config {
  CaptureOptions capture;
  ProviderConfig provider;
  LogLevel log_level = LogLevel::INFO;
};

// Overlays the keys present in `o` onto `base`. Unknown keys are ignored;
// a known key with the wrong type or an out-of-range value throws
// InvalidInput.
Config config_from_json(const json::Object &o, Config base = {});

// Reads a JSON config file. Throws InvalidInput if it cannot be read or
// parsed.
Config load_config(const std::string &path, Config base = {});

json::Object config_to_json(const Config &c);

} // namespace uiscope
