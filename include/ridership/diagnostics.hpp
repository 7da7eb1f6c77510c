#pragma once

/// @file include/ridership/diagnostics.hpp
/// @brief Error kinds and the per-run diagnostic log.
///
/// # Module: Diagnostics
///
/// ## Responsibility
/// Carry every non-crashing problem a run detects back to the caller, with
/// enough context (device, entity, bucket, batch size) to act on it.
///
/// ## Error Kinds
/// | Kind                    | Raised by                    | Effect                      |
/// |-------------------------|------------------------------|-----------------------------|
/// | InsufficientData        | normalizer, aggregator, scorer | entity/device omitted     |
/// | DegenerateNormalization | scorer                       | whole batch has no rows     |
/// | UnmappedEntity          | aggregator (Complex grouping)| station rows dropped        |
/// | MalformedReading        | normalizer                   | only that interval dropped  |
///
/// Stages append to a DiagnosticLog passed by reference; nothing throws.

#include "ridership/constants.hpp"
#include "ridership/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ridership {

// ─── ErrorKind ───────────────────────────────────────────────────────────────

enum class ErrorKind {
    InsufficientData,         ///< Zero valid intervals / entities / records
    DegenerateNormalization,  ///< All raw priorities equal in a batch
    UnmappedEntity,           ///< Station has no complex under Complex grouping
    MalformedReading,         ///< Non-increasing timestamp within a device
};

/// Convert ErrorKind to its CamelCase name.
[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

/// True only for DegenerateNormalization, the one kind that invalidates a batch.
[[nodiscard]] constexpr bool is_fatal(ErrorKind kind) noexcept {
    return kind == ErrorKind::DegenerateNormalization;
}

// ─── Diagnostic ──────────────────────────────────────────────────────────────

/// One reported problem.
struct Diagnostic {
    ErrorKind                kind;
    std::string              message;
    std::optional<DeviceId>  device;
    std::optional<EntityId>  entity;
    std::optional<Timestamp> bucket;
    std::size_t              batch_size{0};     ///< Records in the batch concerned
    std::size_t              affected_rows{0};  ///< Rows dropped because of it

    /// One-line rendering, e.g.
    /// `MalformedReading device=12 bucket=2020-06-27 04:00:00: duplicate timestamp`.
    [[nodiscard]] std::string to_string() const;
};

// ─── DiagnosticLog ───────────────────────────────────────────────────────────

/// Append-only collection of diagnostics for one pipeline run.
class DiagnosticLog {
public:
    void record(Diagnostic diagnostic);

    /// Append every entry of `other`, preserving order.
    void merge(const DiagnosticLog& other);

    [[nodiscard]] std::size_t count(ErrorKind kind) const noexcept;
    [[nodiscard]] bool has(ErrorKind kind) const noexcept;

    /// Sum of `affected_rows` over entries of `kind`.
    [[nodiscard]] std::size_t affected_rows(ErrorKind kind) const noexcept;

    [[nodiscard]] std::span<const Diagnostic> entries() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    void clear() noexcept;

    /// Multi-line summary: a count line per kind present, followed by up to
    /// `preview` entries of that kind.
    [[nodiscard]] std::string
    to_string(std::size_t preview = constants::DIAGNOSTIC_PREVIEW_LIMIT) const;

private:
    std::vector<Diagnostic> entries_;
};

}  // namespace ridership
