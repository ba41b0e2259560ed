#pragma once

#include "dissector.h"
#include "port_registry.h"
#include <string>

namespace YAML { class Node; }

struct LoggingSettings {
    std::string level = "info";
};

// Everything the YAML document configures. Defaults match the registered
// TAK / OMNI ports.
struct DissectorConfig {
    PortSettings ports;
    DecoderSettings decoder;
    LoggingSettings logging;
};

// ── Config Loader ──
// Invalid documents throw std::runtime_error naming the offending key;
// the previously loaded config is left untouched in that case.
class ConfigLoader {
public:
    void load_file(const std::string& file_path);
    void load_string(const std::string& text);

    const DissectorConfig& config() const { return config_; }

private:
    void load_root(const YAML::Node& root);

    DissectorConfig config_;
};
