#pragma once

#include <string>

#include "config/config.pb.h"

namespace docrev::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; the result is
  merged over Defaults(), so a file only needs the keys it changes.
  Unknown keys are rejected.

  Throws util::IOError (unreadable file) or util::InvalidArgument.
*/
class ConfigLoader {
 public:
  static docrev::runtime::config::RuntimeConfig Defaults();

  static docrev::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace docrev::config
