#include "port_registry.h"

#include <spdlog/spdlog.h>

const char* table_name(Transport t) {
    switch (t) {
    case Transport::TCP:  return "tcp.port";
    case Transport::UDP:  return "udp.port";
    case Transport::QUIC: return "quic.port";
    }
    return "";
}

// ── DissectorTable ──

void DissectorTable::add(uint16_t port, const std::string& protocol) {
    entries_[port] = protocol;
}

void DissectorTable::remove(uint16_t port, const std::string& protocol) {
    auto it = entries_.find(port);
    if (it != entries_.end() && it->second == protocol) entries_.erase(it);
}

std::string DissectorTable::lookup(uint16_t port) const {
    auto it = entries_.find(port);
    return it != entries_.end() ? it->second : std::string();
}

std::set<uint16_t> TakPorts::active() const {
    std::set<uint16_t> ports;
    for (uint16_t p : {default_port, sa_multicast, sensor, streaming, chat}) {
        if (p != 0) ports.insert(p);
    }
    return ports;
}

static std::set<uint16_t> omni_ports(const PortSettings& s) {
    if (s.omni_port == 0) return {};
    return {s.omni_port};
}

// ── PortRegistry ──

PortRegistry::PortRegistry(bool quic_available) : quic_available_(quic_available) {
    tables_.emplace(Transport::TCP, DissectorTable(table_name(Transport::TCP)));
    tables_.emplace(Transport::UDP, DissectorTable(table_name(Transport::UDP)));
    if (quic_available_) {
        tables_.emplace(Transport::QUIC, DissectorTable(table_name(Transport::QUIC)));
    }
}

void PortRegistry::swap_ports(const std::string& protocol, const std::set<uint16_t>& before,
                              const std::set<uint16_t>& after) {
    for (uint16_t p : before) {
        if (after.count(p)) continue;
        for (auto& [t, table] : tables_) table.remove(p, protocol);
        spdlog::info("{}: unregistered port {}", protocol, p);
    }
    for (uint16_t p : after) {
        if (before.count(p)) continue;
        for (auto& [t, table] : tables_) table.add(p, protocol);
        spdlog::info("{}: registered port {}", protocol, p);
    }
}

void PortRegistry::apply(const PortSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<uint16_t> tak_before, omni_before;
    if (applied_) {
        tak_before = current_.tak.active();
        omni_before = omni_ports(current_);
    }

    swap_ports("tak", tak_before, settings.tak.active());
    swap_ports("omni", omni_before, omni_ports(settings));

    current_ = settings;
    applied_ = true;
}

std::string PortRegistry::route(Transport t, uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find(t);
    if (it == tables_.end()) return "";
    return it->second.lookup(port);
}

PortSettings PortRegistry::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}
