#include "engine.h"
#include "logging.h"

#include <algorithm>
#include <atomic>

#include <spdlog/spdlog.h>

DissectorEngine::DissectorEngine(const DissectorConfig& config, bool quic_available)
    : ports_(quic_available)
{
    // ── Dispatch table ──
    dispatch_["tak"] = [](const DissectorSet& s, const pb::ByteSpan& p, DissectOutput& out) {
        return s.tak.dissect(p, out);
    };
    dispatch_["omni"] = [](const DissectorSet& s, const pb::ByteSpan& p, DissectOutput& out) {
        return s.omni.dissect(p, out);
    };

    init_logging(config.logging.level);
    publish(config, nullptr);
    ports_.apply(config.ports);
}

std::shared_ptr<const DissectorEngine::DissectorSet> DissectorEngine::snapshot() const {
    return std::atomic_load(&dissectors_);
}

void DissectorEngine::publish(const DissectorConfig& config, PlainTextHandler plain_text) {
    auto set = std::make_shared<DissectorSet>(DissectorSet{
        TakDissector(config.decoder), OmniDissector(config.decoder), config, std::move(plain_text)});
    set->tak.set_plain_text_handler(set->plain_text);
    std::atomic_store(&dissectors_, std::shared_ptr<const DissectorSet>(std::move(set)));
}

size_t DissectorEngine::dissect(const std::string& protocol, const uint8_t* buf, size_t buf_len,
                                size_t offset, size_t length, DissectOutput& out) const {
    auto it = dispatch_.find(protocol);
    if (it == dispatch_.end()) {
        spdlog::debug("no dissector named '{}'", protocol);
        return 0;
    }
    auto set = snapshot();
    pb::ByteSpan payload = pb::ByteSpan(buf, buf_len).subspan(offset, length);
    return it->second(*set, payload, out);
}

size_t DissectorEngine::dissect_port(Transport transport, uint16_t port, const uint8_t* buf,
                                     size_t buf_len, size_t offset, size_t length,
                                     DissectOutput& out) const {
    std::string protocol = ports_.route(transport, port);
    if (protocol.empty()) return 0;
    return dissect(protocol, buf, buf_len, offset, length, out);
}

void DissectorEngine::reconfigure(const DissectorConfig& config) {
    std::lock_guard<std::mutex> lock(update_mutex_);
    init_logging(config.logging.level);
    // Decoders first, ports second: a newly routed port never reaches a
    // dissector built from the old settings.
    publish(config, snapshot()->plain_text);
    ports_.apply(config.ports);
    spdlog::info("dissectors reconfigured (max nesting depth {})", config.decoder.max_nesting_depth);
}

void DissectorEngine::set_plain_text_handler(PlainTextHandler handler) {
    std::lock_guard<std::mutex> lock(update_mutex_);
    publish(snapshot()->config, std::move(handler));
}

DissectorConfig DissectorEngine::config() const {
    return snapshot()->config;
}

std::vector<std::string> DissectorEngine::protocols() const {
    std::vector<std::string> names;
    for (const auto& [name, fn] : dispatch_) names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}
