/**
 * @file recorder.cpp
 * @brief Console and CSV recorders.
 */
#include "aqt/sim/recorder.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace aqt::sim {

namespace fs = std::filesystem;

// ------------------------------- CsvSink -------------------------------------

detail::CsvSink::CsvSink(std::string header, std::string filename, std::size_t line_limit)
    : header_(std::move(header)),
      filename_(std::move(filename)),
      line_limit_(line_limit == 0 ? 1 : line_limit) {}

void detail::CsvSink::set_output_dir(const std::string& dir) {
    dir_ = dir;
}

std::string detail::CsvSink::file_path() const {
    if (dir_.empty()) return filename_;
    return (fs::path(dir_) / filename_).string();
}

void detail::CsvSink::write(std::string line) {
    if (failed_) return;
    if (lines_.size() >= line_limit_ && !flush()) return;
    lines_.push_back(std::move(line));
}

bool detail::CsvSink::flush() {
    if (failed_) return false;
    if (started_ && lines_.empty()) return true;

    std::error_code ec;
    if (!dir_.empty()) fs::create_directories(dir_, ec);
    if (ec) return fail();

    // First flush starts a fresh file; later ones append.
    const auto mode = started_ ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc);
    std::ofstream out(file_path(), mode);
    if (!out) return fail();

    if (!started_) out << header_ << '\n';
    for (const auto& l : lines_) out << l << '\n';
    out.flush();
    if (!out) return fail();

    started_ = true;
    lines_.clear();
    return true;
}

bool detail::CsvSink::fail() {
    // One error per broken sink; further rows are dropped, not retried.
    failed_ = true;
    ++io_errors_;
    lines_.clear();
    return false;
}

// ------------------------------- DebugPrint ----------------------------------

void DebugPrintRecorder::observe(net::Round rd, bool post_forward,
                                 const net::BufferNetwork& network, AbsorbedView) {
    std::printf("%llu%s:\n%s\n", static_cast<unsigned long long>(rd),
                post_forward ? "'" : "", network.to_string().c_str());
    std::fflush(stdout);
}

void DebugPrintRecorder::finalize() {
    std::printf("Simulation finished.\n");
    std::fflush(stdout);
}

// ------------------------------- BufferLoadCsv -------------------------------

BufferLoadCsvRecorder::BufferLoadCsvRecorder(std::size_t line_limit)
    : sink_(config::constants::BUFFER_LOAD_CSV_HEADER,
            config::constants::BUFFER_LOAD_CSV_FILENAME, line_limit) {}

void BufferLoadCsvRecorder::observe(net::Round rd, bool post_forward,
                                    const net::BufferNetwork& network, AbsorbedView) {
    const char* prime = post_forward ? "1" : "0";
    for (const auto& e : network.edges()) {
        sink_.write(std::to_string(rd) + "," + prime + "," + std::to_string(e.from) + "," +
                    std::to_string(e.to) + "," + std::to_string(*network.load(e.from, e.to)));
    }
}

// ------------------------------- AbsorptionCsv -------------------------------

AbsorptionCsvRecorder::AbsorptionCsvRecorder(std::size_t line_limit)
    : sink_(config::constants::ABSORPTION_CSV_HEADER,
            config::constants::ABSORPTION_CSV_FILENAME, line_limit) {}

void AbsorptionCsvRecorder::observe(net::Round rd, bool post_forward,
                                    const net::BufferNetwork&, AbsorbedView absorbed) {
    if (!post_forward || !absorbed) return;
    for (const auto& p : *absorbed) {
        sink_.write(std::to_string(rd) + "," + std::to_string(p.id()) + "," +
                    std::to_string(p.injection_round()) + "," + std::to_string(p.path().size()));
    }
}

// ------------------------------- Recorder ------------------------------------

const char* to_string(RecorderKind kind) noexcept {
    switch (kind) {
        case RecorderKind::DebugPrint:    return DebugPrintRecorder::kName;
        case RecorderKind::BufferLoadCsv: return BufferLoadCsvRecorder::kName;
        case RecorderKind::AbsorptionCsv: return AbsorptionCsvRecorder::kName;
    }
    return "unknown";
}

std::optional<RecorderKind> parse_recorder_kind(std::string_view name) noexcept {
    if (name == DebugPrintRecorder::kName)    return RecorderKind::DebugPrint;
    if (name == BufferLoadCsvRecorder::kName) return RecorderKind::BufferLoadCsv;
    if (name == AbsorptionCsvRecorder::kName) return RecorderKind::AbsorptionCsv;
    return std::nullopt;
}

Recorder Recorder::make(RecorderKind kind) {
    switch (kind) {
        case RecorderKind::DebugPrint:    return Recorder{DebugPrintRecorder{}};
        case RecorderKind::BufferLoadCsv: return Recorder{BufferLoadCsvRecorder{}};
        case RecorderKind::AbsorptionCsv: return Recorder{AbsorptionCsvRecorder{}};
    }
    return Recorder{DebugPrintRecorder{}};
}

void Recorder::set_output_path(const std::string& dir) {
    std::visit([&](auto& r) { r.set_output_path(dir); }, impl_);
}

void Recorder::observe(net::Round rd, bool post_forward,
                       const net::BufferNetwork& network, AbsorbedView absorbed) {
    std::visit([&](auto& r) { r.observe(rd, post_forward, network, absorbed); }, impl_);
}

void Recorder::finalize() {
    std::visit([](auto& r) { r.finalize(); }, impl_);
}

std::size_t Recorder::io_errors() const noexcept {
    return std::visit([](const auto& r) { return r.io_errors(); }, impl_);
}

} // namespace aqt::sim
