#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <memory>
#include "nfcollect/export_sink.hpp"
#include "nfcollect/flow_normalizer.hpp"
#include "nfcollect/packet_decoder.hpp"
#include "nfcollect/report.hpp"
#include "nfcollect/session_aggregator.hpp"
#include "nfcollect/template_store.hpp"

namespace py = pybind11;

namespace {

/**
 * Template store, decoder and normalizer bundled for Python callers
 */
class FlowDecoder {
public:
    FlowDecoder() : decoder_(store_) {}

    py::dict decode(const py::bytes& datagram, const std::string& exporter_address) {
        std::string buffer = datagram;
        nfcollect::DecodedPacket packet = decoder_.decode(
            reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size(), exporter_address);

        py::list flows;
        for (const auto& flow : normalizer_.normalize(packet)) {
            py::dict record;
            for (const auto& [name, value] : flow.fields()) {
                if (value.is_number()) {
                    record[py::str(name)] = value.number;
                } else {
                    record[py::str(name)] = value.text;
                }
            }
            flows.append(record);
        }

        py::dict result;
        result["version"] = packet.header.version;
        result["unix_secs"] = packet.header.unix_secs;
        result["sequence"] = packet.header.sequence;
        result["source_id"] = packet.header.source_id;
        result["flows"] = flows;
        result["templates_learned"] = packet.templates_learned;
        result["unknown_template_sets"] = packet.unknown_template_sets;
        return result;
    }

    size_t template_count() const { return store_.size(); }

private:
    nfcollect::TemplateStore store_;
    nfcollect::PacketDecoder decoder_;
    nfcollect::FlowNormalizer normalizer_;
};

nfcollect::FlowRecord flow_from_dict(const py::dict& dict) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& item : dict) {
        std::string key = py::cast<std::string>(item.first);
        if (py::isinstance<py::bool_>(item.second)) {
            object[key] = py::cast<bool>(item.second);
        } else if (py::isinstance<py::int_>(item.second)) {
            object[key] = py::cast<uint64_t>(item.second);
        } else {
            object[key] = py::cast<std::string>(py::str(item.second));
        }
    }
    return nfcollect::flow_from_json(object);
}

} // namespace

PYBIND11_MODULE(_nfcollect_core, m) {
    m.doc() = "nfcollect C++ core library - NetFlow v9 / IPFIX decoding and flow pairing";

    py::register_exception<nfcollect::DecodeError>(m, "DecodeError", PyExc_ValueError);

    py::class_<FlowDecoder, std::unique_ptr<FlowDecoder>>(m, "FlowDecoder")
        .def(py::init<>())
        .def("decode", &FlowDecoder::decode,
             py::arg("datagram"), py::arg("exporter_address"),
             "Decode one datagram; returns header fields and normalized flows")
        .def("template_count", &FlowDecoder::template_count,
             "Number of templates learned so far");

    py::class_<nfcollect::Connection>(m, "Connection")
        .def_readonly("src", &nfcollect::Connection::src)
        .def_readonly("dest", &nfcollect::Connection::dest)
        .def_readonly("src_port", &nfcollect::Connection::src_port)
        .def_readonly("dest_port", &nfcollect::Connection::dest_port)
        .def_readonly("size", &nfcollect::Connection::size)
        .def_readonly("duration", &nfcollect::Connection::duration)
        .def_readonly("ip_version", &nfcollect::Connection::ip_version)
        .def_readonly("protocol", &nfcollect::Connection::protocol)
        .def_readonly("timestamp", &nfcollect::Connection::timestamp)
        .def_property_readonly("human_size", [](const nfcollect::Connection& c) {
            return nfcollect::human_size(c.size);
        })
        .def_property_readonly("human_duration", [](const nfcollect::Connection& c) {
            return nfcollect::human_duration(c.duration);
        })
        .def("__repr__", [](const nfcollect::Connection& c) {
            return "<Connection from " + c.src + " to " + c.dest + ", size " +
                   nfcollect::human_size(c.size) + ">";
        });

    m.def("pair_flows", [](const py::list& flows, bool sequential, uint32_t timestamp) {
        std::vector<nfcollect::FlowRecord> records;
        for (const auto& flow : flows) {
            records.push_back(flow_from_dict(py::cast<py::dict>(flow)));
        }
        nfcollect::SessionAggregator aggregator(sequential ? nfcollect::PairingMode::SEQUENTIAL
                                                           : nfcollect::PairingMode::REVERSE_TUPLE);
        return aggregator.pair_batch(records, timestamp);
    }, py::arg("flows"), py::arg("sequential") = false, py::arg("timestamp") = 0,
       "Pair flow dicts of one export into connections");

    m.def("human_size", &nfcollect::human_size, py::arg("bytes"));
    m.def("human_duration", &nfcollect::human_duration, py::arg("milliseconds"));
    m.def("format_timestamp", &nfcollect::format_timestamp, py::arg("epoch_seconds"));
}
