#pragma once

#include "core/result.hpp"
#include "core/row.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace studysync {

enum class OpKind {
    Put,     // insert or full replace
    Patch,   // update of an existing record
    Delete
};

[[nodiscard]] inline const char* to_string(OpKind kind) noexcept {
    switch (kind) {
        case OpKind::Put: return "PUT";
        case OpKind::Patch: return "PATCH";
        case OpKind::Delete: return "DELETE";
    }
    return "PUT";
}

[[nodiscard]] inline std::optional<OpKind> op_kind_from_string(std::string_view s) {
    if (s == "PUT") return OpKind::Put;
    if (s == "PATCH") return OpKind::Patch;
    if (s == "DELETE") return OpKind::Delete;
    return std::nullopt;
}

/**
 * PendingOperation - one entry of the mutation log.
 *
 * `position` is the drain order. `data` is the full row for Put and Patch
 * and empty for Delete.
 */
struct PendingOperation {
    int64_t position{0};
    OpKind kind{OpKind::Put};
    std::string table;
    std::string record_id;
    Row data;

    /**
     * "PUT:cards:<id>"
     */
    [[nodiscard]] std::string describe() const {
        return std::string(to_string(kind)) + ":" + table + ":" + record_id;
    }
};

/**
 * SyncError - a failed upload or connection attempt, queued for retry.
 */
struct SyncError {
    Uuid id;
    std::string operation;
    std::string table;
    std::string record_id;
    std::string message;
    Timestamp timestamp;
    bool retryable{true};
    ErrorKind kind{ErrorKind::Unknown};

    bool operator==(const SyncError&) const = default;
};

[[nodiscard]] inline SyncError make_sync_error(const Error& error, const PendingOperation& op) {
    return SyncError{
        .id = Uuid::generate(),
        .operation = op.describe(),
        .table = op.table,
        .record_id = op.record_id,
        .message = error.message,
        .timestamp = Timestamp::now(),
        .retryable = is_retryable(error),
        .kind = error.kind
    };
}

/**
 * Error not tied to one record, e.g. failing to reach the backend.
 */
[[nodiscard]] inline SyncError make_sync_error(const Error& error, std::string operation) {
    return SyncError{
        .id = Uuid::generate(),
        .operation = std::move(operation),
        .table = {},
        .record_id = {},
        .message = error.message,
        .timestamp = Timestamp::now(),
        .retryable = is_retryable(error),
        .kind = error.kind
    };
}

/**
 * ConflictRecord - audit entry for a resolved conflict.
 */
struct ConflictRecord {
    std::string table;
    std::string record_id;
    std::string resolution;
    Timestamp timestamp;
};

// ============================================================================
// Sync phase
// ============================================================================

namespace phase {

struct Idle {
    bool operator==(const Idle&) const = default;
};

struct Connecting {
    bool operator==(const Connecting&) const = default;
};

struct Uploading {
    int64_t completed{0};
    int64_t total{0};

    [[nodiscard]] int64_t pending() const noexcept { return total - completed; }
    bool operator==(const Uploading&) const = default;
};

struct Downloading {
    bool operator==(const Downloading&) const = default;
};

struct Completed {
    bool operator==(const Completed&) const = default;
};

struct Failed {
    SyncError error;
    bool operator==(const Failed&) const = default;
};

} // namespace phase

/**
 * SyncPhase - exactly one stage of a sync cycle at a time.
 */
using SyncPhase = std::variant<
    phase::Idle,
    phase::Connecting,
    phase::Uploading,
    phase::Downloading,
    phase::Completed,
    phase::Failed
>;

/**
 * Whether a cycle is in flight (connecting, uploading or downloading).
 */
[[nodiscard]] inline bool is_active(const SyncPhase& p) noexcept {
    return std::holds_alternative<phase::Connecting>(p) ||
           std::holds_alternative<phase::Uploading>(p) ||
           std::holds_alternative<phase::Downloading>(p);
}

/**
 * Short status line: "Ready", "Connecting...", "Syncing 3/10...",
 * "Downloading...", "Synced", "Failed: <message>".
 */
[[nodiscard]] inline std::string describe(const SyncPhase& p) {
    struct Visitor {
        std::string operator()(const phase::Idle&) const { return "Ready"; }
        std::string operator()(const phase::Connecting&) const { return "Connecting..."; }
        std::string operator()(const phase::Uploading& u) const {
            return "Syncing " + std::to_string(u.completed) + "/" + std::to_string(u.total) + "...";
        }
        std::string operator()(const phase::Downloading&) const { return "Downloading..."; }
        std::string operator()(const phase::Completed&) const { return "Synced"; }
        std::string operator()(const phase::Failed& f) const { return "Failed: " + f.error.message; }
    };
    return std::visit(Visitor{}, p);
}

} // namespace studysync
