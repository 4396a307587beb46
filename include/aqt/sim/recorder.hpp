#pragma once
/**
 * @file recorder.hpp
 * @brief Result sinks that take snapshots of the simulation each half-round.
 *
 * The driver calls observe() twice per round (after injection with no
 * absorbed list, after forwarding with the protocol's absorbed list) and
 * finalize() exactly once when the run stops.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "aqt/config/constants.hpp"
#include "aqt/net/buffer_network.hpp"

namespace aqt::sim {

/// Absorbed packets of a post-forward observation; absent after injection.
using AbsorbedView = std::optional<std::span<const net::Packet>>;

namespace detail {

/**
 * @brief Line buffer that appends to a CSV file once it reaches its limit.
 * @note The first flush truncates the file and writes the header. After an
 *       I/O failure the sink stops writing and discards further lines.
 */
class CsvSink final {
public:
    CsvSink(std::string header, std::string filename,
            std::size_t line_limit = config::constants::RECORDER_LINE_LIMIT);

    /// Directory the file is written to (created on first flush).
    void set_output_dir(const std::string& dir);

    void write(std::string line);

    /// Append buffered lines to disk. Returns false on I/O failure.
    bool flush();

    [[nodiscard]] std::string file_path() const;
    [[nodiscard]] std::size_t io_errors() const noexcept { return io_errors_; }
    [[nodiscard]] std::size_t line_limit() const noexcept { return line_limit_; }
    [[nodiscard]] std::size_t buffered() const noexcept { return lines_.size(); }
    [[nodiscard]] bool        failed() const noexcept { return failed_; }

private:
    bool fail();

    std::string              header_;
    std::string              filename_;
    std::string              dir_{};
    std::size_t              line_limit_;
    std::vector<std::string> lines_{};
    bool                     started_{false};
    bool                     failed_{false};
    std::size_t              io_errors_{0};
};

} // namespace detail

/// Prints the whole network to stdout: "rd:" before forwarding, "rd':" after.
class DebugPrintRecorder final {
public:
    static constexpr const char* kName = "debug_print";

    void set_output_path(const std::string&) noexcept {}
    void observe(net::Round rd, bool post_forward, const net::BufferNetwork& network, AbsorbedView absorbed);
    void finalize();
    [[nodiscard]] std::size_t io_errors() const noexcept { return 0; }
};

/// One CSV row per edge per observation: rd,prime,buffer_from,buffer_to,load.
class BufferLoadCsvRecorder final {
public:
    static constexpr const char* kName = "buffer_load_csv";

    explicit BufferLoadCsvRecorder(std::size_t line_limit = config::constants::RECORDER_LINE_LIMIT);

    void set_output_path(const std::string& dir) { sink_.set_output_dir(dir); }
    void observe(net::Round rd, bool post_forward, const net::BufferNetwork& network, AbsorbedView absorbed);
    void finalize() { (void)sink_.flush(); }
    [[nodiscard]] std::size_t io_errors() const noexcept { return sink_.io_errors(); }
    [[nodiscard]] std::string file_path() const { return sink_.file_path(); }

private:
    detail::CsvSink sink_;
};

/// One CSV row per absorbed packet: rd,packet_id,injection_rd,path_len.
class AbsorptionCsvRecorder final {
public:
    static constexpr const char* kName = "absorption_csv";

    explicit AbsorptionCsvRecorder(std::size_t line_limit = config::constants::RECORDER_LINE_LIMIT);

    void set_output_path(const std::string& dir) { sink_.set_output_dir(dir); }
    void observe(net::Round rd, bool post_forward, const net::BufferNetwork& network, AbsorbedView absorbed);
    void finalize() { (void)sink_.flush(); }
    [[nodiscard]] std::size_t io_errors() const noexcept { return sink_.io_errors(); }
    [[nodiscard]] std::string file_path() const { return sink_.file_path(); }

private:
    detail::CsvSink sink_;
};

enum class RecorderKind : std::uint8_t {
    DebugPrint = 0, ///< "debug_print"
    BufferLoadCsv,  ///< "buffer_load_csv"
    AbsorptionCsv   ///< "absorption_csv"
};

[[nodiscard]] const char* to_string(RecorderKind kind) noexcept;
[[nodiscard]] std::optional<RecorderKind> parse_recorder_kind(std::string_view name) noexcept;

/** @class Recorder
 *  @brief Closed sum type over the result sinks.
 */
class Recorder final {
public:
    using Variant = std::variant<DebugPrintRecorder, BufferLoadCsvRecorder, AbsorptionCsvRecorder>;

    Recorder(DebugPrintRecorder r) : impl_(std::move(r)) {}
    Recorder(BufferLoadCsvRecorder r) : impl_(std::move(r)) {}
    Recorder(AbsorptionCsvRecorder r) : impl_(std::move(r)) {}

    static Recorder make(RecorderKind kind);

    void set_output_path(const std::string& dir);
    void observe(net::Round rd, bool post_forward, const net::BufferNetwork& network, AbsorbedView absorbed);
    void finalize();

    /// Failed disk writes so far (CSV recorders only).
    [[nodiscard]] std::size_t io_errors() const noexcept;

    [[nodiscard]] RecorderKind kind() const noexcept { return static_cast<RecorderKind>(impl_.index()); }
    [[nodiscard]] const char*  name() const noexcept { return to_string(kind()); }

    [[nodiscard]] const Variant& variant() const noexcept { return impl_; }

private:
    Variant impl_;
};

} // namespace aqt::sim
