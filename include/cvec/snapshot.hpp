#pragma once

/**
 * @file snapshot.hpp
 * @brief JSON views of vectors and errors for log and telemetry sinks
 */

#include "cvec/common.hpp"
#include "cvec/correlation_vector.hpp"

#include <string_view>

#include <nlohmann/json.hpp>

namespace cvec::snapshot {

constexpr std::string_view kSnapshotSchemaVersion = "cv_snapshot.v1";

/**
 * Point-in-time view of a vector:
 * schema_version, tool, value, base, extension, version ("V1"/"V2"), immutable
 */
[[nodiscard]] nlohmann::json snapshot_json(const CorrelationVector& vector);

/**
 * {code, message}
 */
[[nodiscard]] nlohmann::json error_json(const Error& error);

/**
 * Snapshot of parsed.vector, plus an "error" member when a recoverable
 * error was reported.
 */
[[nodiscard]] nlohmann::json parsed_json(const Parsed& parsed);

}  // namespace cvec::snapshot
