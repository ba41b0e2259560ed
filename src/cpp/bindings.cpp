#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "config_loader.h"
#include "engine.h"
#include "envelope.h"
#include "field_registry.h"
#include "logging.h"

namespace py = pybind11;
using namespace pybind11::literals;

// ── Result tree -> Python ──

static py::object field_value_to_py(const FieldValue& v) {
    return std::visit([](auto&& x) -> py::object {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return py::none();
        } else {
            return py::cast(x);
        }
    }, v);
}

static const char* field_type_name(FieldType t) {
    switch (t) {
    case FieldType::NONE:   return "none";
    case FieldType::STRING: return "string";
    case FieldType::UINT8:  return "uint8";
    case FieldType::UINT32: return "uint32";
    case FieldType::UINT64: return "uint64";
    case FieldType::DOUBLE: return "double";
    }
    return "none";
}

static py::dict node_to_pydict(const FieldNode& node) {
    py::list children;
    for (const auto& c : node.children) children.append(node_to_pydict(c));

    return py::dict(
        "abbrev"_a = node.abbrev(),
        "text"_a = node.display(),
        "value"_a = field_value_to_py(node.value),
        "offset"_a = node.offset,
        "length"_a = node.length,
        "children"_a = children
    );
}

static py::dict output_to_pydict(const DissectOutput& out, size_t consumed) {
    py::list experts;
    for (const auto& e : out.experts) {
        experts.append(py::dict(
            "abbrev"_a = e.def->abbrev,
            "severity"_a = e.def->severity == ExpertDef::Severity::ERROR ? "error" : "warning",
            "group"_a = e.def->group == ExpertDef::Group::MALFORMED ? "malformed" : "undecoded",
            "message"_a = e.message
        ));
    }

    return py::dict(
        "consumed"_a = consumed,
        "protocol"_a = out.protocol_column,
        "info"_a = out.info_column,
        "tree"_a = node_to_pydict(out.root),
        "experts"_a = experts
    );
}

static Transport parse_transport(const std::string& name) {
    if (name == "tcp")  return Transport::TCP;
    if (name == "udp")  return Transport::UDP;
    if (name == "quic") return Transport::QUIC;
    throw py::value_error("Unknown transport: " + name);
}

// ── NativeDissector ──
// Host-facing object: owns the config and the engine.

class NativeDissector {
public:
    explicit NativeDissector(const std::string& config_path) {
        if (!config_path.empty()) loader_.load_file(config_path);
        engine_ = std::make_unique<DissectorEngine>(loader_.config());
    }

    py::dict dissect(py::bytes buf, const std::string& protocol, size_t offset, int64_t length) {
        std::string data = buf;
        DissectOutput out;
        size_t consumed = engine_->dissect(protocol,
            reinterpret_cast<const uint8_t*>(data.data()), data.size(),
            offset, window(data.size(), offset, length), out);
        return output_to_pydict(out, consumed);
    }

    py::dict dissect_port(py::bytes buf, const std::string& transport, uint16_t port,
                          size_t offset, int64_t length) {
        std::string data = buf;
        DissectOutput out;
        size_t consumed = engine_->dissect_port(parse_transport(transport), port,
            reinterpret_cast<const uint8_t*>(data.data()), data.size(),
            offset, window(data.size(), offset, length), out);
        return output_to_pydict(out, consumed);
    }

    std::string route(const std::string& transport, uint16_t port) const {
        return engine_->route(parse_transport(transport), port);
    }

    void reconfigure(const std::string& config_path) {
        loader_.load_file(config_path);
        engine_->reconfigure(loader_.config());
    }

    void reconfigure_string(const std::string& yaml_text) {
        loader_.load_string(yaml_text);
        engine_->reconfigure(loader_.config());
    }

    // The callable receives the raw document and returns text for the info column.
    void set_plain_text_handler(py::function fn) {
        engine_->set_plain_text_handler(
            [fn](const pb::ByteSpan& payload, FieldNode& root, DissectOutput& out) {
                py::gil_scoped_acquire gil;
                py::object r = fn(py::bytes(reinterpret_cast<const char*>(payload.data()), payload.size()));
                if (r.is_none()) return;
                std::string text = r.cast<std::string>();
                if (text.empty()) return;
                out.info_column += " " + text;
                root.append_text(": " + text);
            });
    }

    py::dict config() const {
        DissectorConfig cfg = engine_->config();
        return py::dict(
            "tak_ports"_a = std::vector<uint16_t>{cfg.ports.tak.default_port, cfg.ports.tak.sa_multicast,
                                                  cfg.ports.tak.sensor, cfg.ports.tak.streaming,
                                                  cfg.ports.tak.chat},
            "omni_port"_a = cfg.ports.omni_port,
            "max_nesting_depth"_a = cfg.decoder.max_nesting_depth,
            "log_level"_a = cfg.logging.level
        );
    }

private:
    // length < 0 means "to the end of the buffer"
    static size_t window(size_t size, size_t offset, int64_t length) {
        if (length < 0) return offset < size ? size - offset : 0;
        return static_cast<size_t>(length);
    }

    ConfigLoader loader_;
    std::unique_ptr<DissectorEngine> engine_;
};

PYBIND11_MODULE(_takdissect_native, m) {
    m.doc() = "takdissect native C++ engine";

    py::class_<NativeDissector>(m, "NativeDissector")
        .def(py::init<const std::string&>(), py::arg("config_path") = "")
        .def("dissect", &NativeDissector::dissect,
             py::arg("buf"), py::arg("protocol"), py::arg("offset") = 0, py::arg("length") = -1)
        .def("dissect_port", &NativeDissector::dissect_port,
             py::arg("buf"), py::arg("transport"), py::arg("port"),
             py::arg("offset") = 0, py::arg("length") = -1)
        .def("route", &NativeDissector::route, py::arg("transport"), py::arg("port"))
        .def("reconfigure", &NativeDissector::reconfigure, py::arg("config_path"))
        .def("reconfigure_string", &NativeDissector::reconfigure_string, py::arg("yaml_text"))
        .def("set_plain_text_handler", &NativeDissector::set_plain_text_handler, py::arg("handler"))
        .def_property_readonly("config", &NativeDissector::config);

    m.def("classify", [](py::bytes buf) {
        std::string data = buf;
        Envelope env = classify_envelope(
            pb::ByteSpan(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
        return py::dict(
            "variant"_a = variant_name(env.variant),
            "ok"_a = env.ok(),
            "version"_a = env.version,
            "payload_offset"_a = env.payload_offset,
            "payload_length"_a = env.payload_length
        );
    }, py::arg("buf"));

    m.def("field_definitions", []() {
        py::list fields;
        for (const FieldInfo* f : hf::all_fields()) {
            fields.append(py::dict("abbrev"_a = f->abbrev, "name"_a = f->name,
                                   "type"_a = field_type_name(f->type)));
        }
        return fields;
    });

    m.def("expert_definitions", []() {
        py::list experts;
        for (const ExpertDef* e : ei::all_experts()) {
            experts.append(py::dict("abbrev"_a = e->abbrev, "summary"_a = e->summary));
        }
        return experts;
    });

    m.def("set_log_level", &init_logging, py::arg("level"));
}
