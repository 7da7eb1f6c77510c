/// @file src/core/diagnostics.cpp
/// @brief DiagnosticLog and Diagnostic rendering.

#include "ridership/diagnostics.hpp"
#include "ridership/calendar.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

namespace ridership {

// ─── ErrorKind ───────────────────────────────────────────────────────────────

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InsufficientData:        return "InsufficientData";
        case ErrorKind::DegenerateNormalization: return "DegenerateNormalization";
        case ErrorKind::UnmappedEntity:          return "UnmappedEntity";
        case ErrorKind::MalformedReading:        return "MalformedReading";
    }
    return "Unknown";
}

// ─── Diagnostic::to_string ───────────────────────────────────────────────────

std::string Diagnostic::to_string() const {
    std::string out = ridership::to_string(kind);

    if (device) {
        out += fmt::format(" device={}", device->value);
    }
    if (entity) {
        out += fmt::format(" {}={}", ridership::to_string(entity->kind), entity->value);
    }
    if (bucket) {
        out += fmt::format(" bucket={}", calendar::format_timestamp(*bucket));
    }
    if (batch_size > 0) {
        out += fmt::format(" batch={}", batch_size);
    }
    if (affected_rows > 0) {
        out += fmt::format(" rows={}", affected_rows);
    }
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

// ─── DiagnosticLog ───────────────────────────────────────────────────────────

void DiagnosticLog::record(Diagnostic diagnostic) {
    entries_.push_back(std::move(diagnostic));
}

void DiagnosticLog::merge(const DiagnosticLog& other) {
    entries_.insert(entries_.end(), other.entries_.begin(), other.entries_.end());
}

std::size_t DiagnosticLog::count(ErrorKind kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(),
        [kind](const Diagnostic& d) { return d.kind == kind; }));
}

bool DiagnosticLog::has(ErrorKind kind) const noexcept {
    return std::any_of(entries_.begin(), entries_.end(),
                       [kind](const Diagnostic& d) { return d.kind == kind; });
}

std::size_t DiagnosticLog::affected_rows(ErrorKind kind) const noexcept {
    std::size_t rows = 0;
    for (const auto& d : entries_) {
        if (d.kind == kind) {
            rows += d.affected_rows;
        }
    }
    return rows;
}

std::span<const Diagnostic> DiagnosticLog::entries() const noexcept {
    return entries_;
}

std::size_t DiagnosticLog::size() const noexcept {
    return entries_.size();
}

bool DiagnosticLog::empty() const noexcept {
    return entries_.empty();
}

void DiagnosticLog::clear() noexcept {
    entries_.clear();
}

std::string DiagnosticLog::to_string(std::size_t preview) const {
    static constexpr std::array<ErrorKind, 4> ORDER = {
        ErrorKind::DegenerateNormalization,
        ErrorKind::InsufficientData,
        ErrorKind::UnmappedEntity,
        ErrorKind::MalformedReading,
    };

    std::string out;
    for (const ErrorKind kind : ORDER) {
        const std::size_t n = count(kind);
        if (n == 0) {
            continue;
        }

        const std::size_t rows = affected_rows(kind);
        if (rows > 0) {
            fmt::format_to(std::back_inserter(out), "{}: {} reported, {} rows dropped\n",
                           ridership::to_string(kind), n, rows);
        } else {
            fmt::format_to(std::back_inserter(out), "{}: {} reported\n",
                           ridership::to_string(kind), n);
        }

        std::size_t shown = 0;
        for (const auto& d : entries_) {
            if (d.kind != kind) continue;
            if (shown == preview) {
                fmt::format_to(std::back_inserter(out), "  ... {} more\n", n - shown);
                break;
            }
            fmt::format_to(std::back_inserter(out), "  {}\n", d.to_string());
            ++shown;
        }
    }
    return out;
}

}  // namespace ridership
