#include <pybind11/chrono.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "dmm/device_session.hpp"
#include "dmm/errors.hpp"
#include "dmm/protocol/frame_decoder.hpp"

namespace py = pybind11;

// Build a RawFrame from a Python sequence of 22 byte values.
dmm::RawFrame frame_from_list(const std::vector<uint8_t> &bytes) {
    if (bytes.size() != dmm::kFrameLength) {
        throw std::invalid_argument("a frame is exactly 22 bytes, got " + std::to_string(bytes.size()));
    }
    dmm::RawFrame frame;
    std::copy(bytes.begin(), bytes.end(), frame.bytes.begin());
    frame.captured_at = dmm::RawFrame::Clock::now();
    return frame;
}

PYBIND11_MODULE(dmm_link, m) {
    m.doc() = "Handheld multimeter LCD stream decoder";

    py::register_exception<dmm::DecodeError>(m, "DecodeError", PyExc_ValueError);
    py::register_exception<dmm::TransportError>(m, "TransportError", PyExc_IOError);

    py::enum_<dmm::Prefix>(m, "Prefix")
        .value("NONE", dmm::Prefix::None)
        .value("NANO", dmm::Prefix::Nano)
        .value("MICRO", dmm::Prefix::Micro)
        .value("MILLI", dmm::Prefix::Milli)
        .value("KILO", dmm::Prefix::Kilo)
        .value("MEGA", dmm::Prefix::Mega);

    py::class_<dmm::MeterFlags>(m, "MeterFlags")
        .def(py::init<>())
        .def_readwrite("diode", &dmm::MeterFlags::diode)
        .def_readwrite("beep", &dmm::MeterFlags::beep)
        .def_readwrite("unidentified_indicator", &dmm::MeterFlags::unidentified_indicator)
        .def_readwrite("low_battery", &dmm::MeterFlags::low_battery)
        .def_readwrite("min", &dmm::MeterFlags::min)
        .def_readwrite("max", &dmm::MeterFlags::max)
        .def_readwrite("min_max", &dmm::MeterFlags::min_max)
        .def_readwrite("auto_range", &dmm::MeterFlags::auto_range)
        .def_readwrite("usb", &dmm::MeterFlags::usb)
        .def_readwrite("bar", &dmm::MeterFlags::bar);

    py::class_<dmm::RawFrame>(m, "RawFrame")
        .def(py::init(&frame_from_list), py::arg("bytes"))
        .def_readwrite("bytes", &dmm::RawFrame::bytes)
        .def_readwrite("captured_at", &dmm::RawFrame::captured_at);

    py::class_<dmm::Measurement>(m, "Measurement")
        .def_readonly("timestamp", &dmm::Measurement::timestamp)
        .def_readonly("raw", &dmm::Measurement::raw)
        .def_readonly("display", &dmm::Measurement::display)
        .def_readonly("value", &dmm::Measurement::value)
        .def_readonly("unit", &dmm::Measurement::unit)
        .def_readonly("prefix", &dmm::Measurement::prefix)
        .def_readonly("multiplier", &dmm::Measurement::multiplier)
        .def_readonly("flags", &dmm::Measurement::flags)
        .def_readonly("name", &dmm::Measurement::name);

    py::class_<dmm::FrameDecoder>(m, "FrameDecoder")
        .def(py::init<>())
        .def("decode", &dmm::FrameDecoder::decode, py::arg("frame"));

    py::class_<dmm::DeviceSession>(m, "DeviceSession")
        .def(py::init([](const std::string &name, std::size_t depth, int poll_ms) {
                 dmm::SessionConfig config;
                 config.name = name;
                 config.history_depth = depth;
                 config.poll_interval = std::chrono::milliseconds(poll_ms);
                 return std::make_unique<dmm::DeviceSession>(config);
             }),
             py::arg("name") = "", py::arg("depth") = dmm::HistoryBuffer::kDefaultDepth, py::arg("poll_ms") = 50)
        .def(
            "open",
            [](dmm::DeviceSession &self, const std::string &device, uint32_t baud) {
                self.open(dmm::SerialConfig{device, baud});
            },
            py::arg("device"), py::arg("baud") = 2400)
        .def("close", &dmm::DeviceSession::close)
        .def("read", py::overload_cast<>(&dmm::DeviceSession::read), "Latest reading or None")
        .def("read_frame", py::overload_cast<const dmm::RawFrame &>(&dmm::DeviceSession::read, py::const_),
             py::arg("frame"))
        .def("read_history", &dmm::DeviceSession::read_history)
        .def_property_readonly("is_open", &dmm::DeviceSession::is_open)
        .def_property_readonly("name", &dmm::DeviceSession::name);
}
