#include <gtest/gtest.h>

#include "config_loader.h"

#include <stdexcept>
#include <string>

namespace {

// Message of the runtime_error fn throws, or "" when it does not throw.
template <typename Fn>
std::string error_of(Fn&& fn) {
    try {
        fn();
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

void expect_defaults(const DissectorConfig& cfg) {
    EXPECT_EQ(cfg.ports.tak.default_port, 4242);
    EXPECT_EQ(cfg.ports.tak.sa_multicast, 6969);
    EXPECT_EQ(cfg.ports.tak.sensor, 7171);
    EXPECT_EQ(cfg.ports.tak.streaming, 8087);
    EXPECT_EQ(cfg.ports.tak.chat, 17012);
    EXPECT_EQ(cfg.ports.omni_port, 8089);
    EXPECT_EQ(cfg.decoder.max_nesting_depth, 32u);
    EXPECT_EQ(cfg.logging.level, "info");
}

} // namespace

TEST(ConfigLoader, DefaultsWithoutLoading) {
    ConfigLoader loader;
    expect_defaults(loader.config());
}

TEST(ConfigLoader, ShippedFileMatchesDefaults) {
    ConfigLoader loader;
    loader.load_file(std::string(TAKDISSECT_CONFIG_DIR) + "/takdissect.yaml");
    expect_defaults(loader.config());
}

TEST(ConfigLoader, EmptyDocumentKeepsDefaults) {
    ConfigLoader loader;
    loader.load_string("");
    expect_defaults(loader.config());
}

TEST(ConfigLoader, OverridesPartialSections) {
    ConfigLoader loader;
    loader.load_string(
        "tak:\n"
        "  ports:\n"
        "    streaming: 9087\n"
        "    chat: 0\n"
        "omni:\n"
        "  port: 9089\n"
        "decoder:\n"
        "  max_nesting_depth: 8\n"
        "logging:\n"
        "  level: debug\n");

    const auto& cfg = loader.config();
    EXPECT_EQ(cfg.ports.tak.default_port, 4242);
    EXPECT_EQ(cfg.ports.tak.streaming, 9087);
    EXPECT_EQ(cfg.ports.tak.chat, 0);
    EXPECT_EQ(cfg.ports.omni_port, 9089);
    EXPECT_EQ(cfg.decoder.max_nesting_depth, 8u);
    EXPECT_EQ(cfg.logging.level, "debug");
}

TEST(ConfigLoader, ReloadStartsFromDefaults) {
    ConfigLoader loader;
    loader.load_string("omni:\n  port: 1000\n");
    loader.load_string("decoder:\n  max_nesting_depth: 4\n");
    EXPECT_EQ(loader.config().ports.omni_port, 8089);
    EXPECT_EQ(loader.config().decoder.max_nesting_depth, 4u);
}

TEST(ConfigLoader, UnknownSectionIsIgnored) {
    ConfigLoader loader;
    loader.load_string("capture:\n  snaplen: 65535\nomni:\n  port: 7000\n");
    EXPECT_EQ(loader.config().ports.omni_port, 7000);
}

TEST(ConfigLoader, PortOutOfRange) {
    ConfigLoader loader;
    std::string err = error_of([&] { loader.load_string("tak:\n  ports:\n    sensor: 70000\n"); });
    EXPECT_NE(err.find("tak.ports.sensor"), std::string::npos) << err;
    EXPECT_NE(err.find("0-65535"), std::string::npos) << err;

    err = error_of([&] { loader.load_string("omni:\n  port: -1\n"); });
    EXPECT_NE(err.find("omni.port"), std::string::npos) << err;
}

TEST(ConfigLoader, PortMustBeInteger) {
    ConfigLoader loader;
    std::string err = error_of([&] { loader.load_string("tak:\n  ports:\n    default: abc\n"); });
    EXPECT_NE(err.find("tak.ports.default must be an integer"), std::string::npos) << err;
}

TEST(ConfigLoader, PortsMustBeMapping) {
    ConfigLoader loader;
    std::string err = error_of([&] { loader.load_string("tak:\n  ports: [4242, 8087]\n"); });
    EXPECT_NE(err.find("tak.ports must be a mapping"), std::string::npos) << err;
}

TEST(ConfigLoader, NestingDepthMustBePositive) {
    ConfigLoader loader;
    std::string err = error_of([&] { loader.load_string("decoder:\n  max_nesting_depth: 0\n"); });
    EXPECT_NE(err.find("decoder.max_nesting_depth"), std::string::npos) << err;
}

TEST(ConfigLoader, UnknownLogLevel) {
    ConfigLoader loader;
    std::string err = error_of([&] { loader.load_string("logging:\n  level: loud\n"); });
    EXPECT_EQ(err, "Config key logging.level has unknown level: loud");
}

TEST(ConfigLoader, DocumentMustBeMapping) {
    ConfigLoader loader;
    EXPECT_THROW(loader.load_string("- 1\n- 2\n"), std::runtime_error);
    EXPECT_THROW(loader.load_string("just a string"), std::runtime_error);
}

TEST(ConfigLoader, SyntaxErrorIsReported) {
    ConfigLoader loader;
    std::string err = error_of([&] { loader.load_string("tak: [unclosed\n"); });
    EXPECT_NE(err.find("Failed to parse config"), std::string::npos) << err;
}

TEST(ConfigLoader, FailedLoadKeepsPreviousConfig) {
    ConfigLoader loader;
    loader.load_string("omni:\n  port: 5555\n");
    EXPECT_THROW(loader.load_string("omni:\n  port: 99999\n"), std::runtime_error);
    EXPECT_EQ(loader.config().ports.omni_port, 5555);
}

TEST(ConfigLoader, MissingFile) {
    ConfigLoader loader;
    std::string err = error_of([&] { loader.load_file("/nonexistent/takdissect.yaml"); });
    EXPECT_EQ(err, "Config file not found: /nonexistent/takdissect.yaml");
}
