#include "config_loader.h"
#include "logging.h"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static long long read_integer(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<long long>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error("Config key " + key + " must be an integer");
    }
}

static uint16_t read_port(const YAML::Node& parent, const char* name,
                          const std::string& prefix, uint16_t fallback) {
    YAML::Node node = parent[name];
    if (!node) return fallback;

    std::string key = prefix + "." + name;
    long long v = read_integer(node, key);
    if (v < 0 || v > 65535) {
        throw std::runtime_error("Config key " + key + " out of range (0-65535): " +
                                 std::to_string(v));
    }
    return static_cast<uint16_t>(v);
}

static void parse_tak(const YAML::Node& node, TakPorts& tak) {
    YAML::Node ports = node["ports"];
    if (!ports) return;
    if (!ports.IsMap()) throw std::runtime_error("Config key tak.ports must be a mapping");

    tak.default_port = read_port(ports, "default", "tak.ports", tak.default_port);
    tak.sa_multicast = read_port(ports, "sa_multicast", "tak.ports", tak.sa_multicast);
    tak.sensor       = read_port(ports, "sensor", "tak.ports", tak.sensor);
    tak.streaming    = read_port(ports, "streaming", "tak.ports", tak.streaming);
    tak.chat         = read_port(ports, "chat", "tak.ports", tak.chat);
}

static void parse_decoder(const YAML::Node& node, DecoderSettings& decoder) {
    YAML::Node depth = node["max_nesting_depth"];
    if (!depth) return;

    long long v = read_integer(depth, "decoder.max_nesting_depth");
    if (v <= 0) {
        throw std::runtime_error("Config key decoder.max_nesting_depth must be positive: " +
                                 std::to_string(v));
    }
    decoder.max_nesting_depth = static_cast<size_t>(v);
}

static void parse_logging(const YAML::Node& node, LoggingSettings& logging) {
    YAML::Node level = node["level"];
    if (!level) return;

    std::string name = level.as<std::string>();
    try {
        parse_log_level(name);
    } catch (const std::runtime_error&) {
        throw std::runtime_error("Config key logging.level has unknown level: " + name);
    }
    logging.level = name;
}

void ConfigLoader::load_root(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        throw std::runtime_error("Config document must be a mapping");
    }

    DissectorConfig cfg;
    try {
        if (YAML::Node tak = root["tak"]) parse_tak(tak, cfg.ports.tak);
        if (YAML::Node omni = root["omni"]) cfg.ports.omni_port = read_port(omni, "port", "omni", cfg.ports.omni_port);
        if (YAML::Node decoder = root["decoder"]) parse_decoder(decoder, cfg.decoder);
        if (YAML::Node logging = root["logging"]) parse_logging(logging, cfg.logging);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }

    if (root.IsMap()) {
        for (auto it = root.begin(); it != root.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (key != "tak" && key != "omni" && key != "decoder" && key != "logging") {
                spdlog::warn("Ignoring unknown config section: {}", key);
            }
        }
    }

    config_ = cfg;
    spdlog::info("Config loaded: TAK ports {}/{}/{}/{}/{}, OMNI port {}, max depth {}",
                 cfg.ports.tak.default_port, cfg.ports.tak.sa_multicast, cfg.ports.tak.sensor,
                 cfg.ports.tak.streaming, cfg.ports.tak.chat, cfg.ports.omni_port,
                 cfg.decoder.max_nesting_depth);
}

void ConfigLoader::load_file(const std::string& file_path) {
    if (!fs::exists(file_path) || !fs::is_regular_file(file_path)) {
        throw std::runtime_error("Config file not found: " + file_path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(file_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + file_path + ": " + e.what());
    }
    load_root(root);
}

void ConfigLoader::load_string(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
    load_root(root);
}
