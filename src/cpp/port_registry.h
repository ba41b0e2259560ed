#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Transport-port routing for the two dissectors. This is the only mutable
// shared state; the decode path never touches it.

enum class Transport { TCP, UDP, QUIC };

// Host table name: "tcp.port", "udp.port", "quic.port"
const char* table_name(Transport t);

// One port -> protocol table, as the host framework keeps per transport.
class DissectorTable {
public:
    explicit DissectorTable(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    void add(uint16_t port, const std::string& protocol);
    // Only removes the entry while it still routes to protocol.
    void remove(uint16_t port, const std::string& protocol);

    std::string lookup(uint16_t port) const;   // "" when unregistered
    size_t size() const { return entries_.size(); }

private:
    std::string name_;
    std::map<uint16_t, std::string> entries_;
};

struct TakPorts {
    uint16_t default_port = 4242;
    uint16_t sa_multicast = 6969;
    uint16_t sensor       = 7171;
    uint16_t streaming    = 8087;
    uint16_t chat         = 17012;

    // Non-zero ports only; 0 means the slot is unregistered.
    std::set<uint16_t> active() const;
};

struct PortSettings {
    TakPorts tak;
    uint16_t omni_port = 8089;
};

class PortRegistry {
public:
    // quic_available: whether the host exposes a "quic.port" table
    explicit PortRegistry(bool quic_available = true);

    // Unregister ports that left the settings and register the new ones, in
    // every available table, as one step. The first call registers everything.
    void apply(const PortSettings& settings);

    // "tak", "omni" or "" for the host's port lookup.
    std::string route(Transport t, uint16_t port) const;

    PortSettings current() const;
    bool quic_available() const { return quic_available_; }

private:
    void swap_ports(const std::string& protocol, const std::set<uint16_t>& before,
                    const std::set<uint16_t>& after);

    mutable std::mutex mutex_;
    bool quic_available_;
    std::map<Transport, DissectorTable> tables_;
    PortSettings current_;
    bool applied_ = false;
};
