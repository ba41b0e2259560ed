#pragma once

#include "config_loader.h"
#include "dissector.h"
#include "port_registry.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// The dissectors plus port routing, configured from one DissectorConfig.
// dissect() and config() may run on any number of threads; reconfigure()
// swaps in a new dissector set without blocking calls already in flight.
class DissectorEngine {
public:
    explicit DissectorEngine(const DissectorConfig& config = {}, bool quic_available = true);

    // Dissect with a named dissector ("tak" / "omni"). Unknown names claim
    // nothing and return 0.
    size_t dissect(const std::string& protocol, const uint8_t* buf, size_t buf_len,
                   size_t offset, size_t length, DissectOutput& out) const;

    // Route by transport port first, as the host's port table would.
    size_t dissect_port(Transport transport, uint16_t port, const uint8_t* buf, size_t buf_len,
                        size_t offset, size_t length, DissectOutput& out) const;

    void reconfigure(const DissectorConfig& config);
    void set_plain_text_handler(PlainTextHandler handler);

    std::string route(Transport transport, uint16_t port) const { return ports_.route(transport, port); }
    const PortRegistry& ports() const { return ports_; }
    DissectorConfig config() const;
    std::vector<std::string> protocols() const;

private:
    // Everything reconfigure() replaces, published as one immutable value.
    struct DissectorSet {
        TakDissector tak;
        OmniDissector omni;
        DissectorConfig config;
        PlainTextHandler plain_text;
    };
    using DissectFn = std::function<size_t(const DissectorSet&, const pb::ByteSpan&, DissectOutput&)>;

    std::shared_ptr<const DissectorSet> snapshot() const;
    void publish(const DissectorConfig& config, PlainTextHandler plain_text);

    std::unordered_map<std::string, DissectFn> dispatch_;
    std::shared_ptr<const DissectorSet> dissectors_;
    std::mutex update_mutex_;   // serializes reconfigure / set_plain_text_handler
    PortRegistry ports_;
};
