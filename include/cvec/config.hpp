#pragma once

/**
 * @file config.hpp
 * @brief Loading Options from JSON documents
 *
 * Document shape (schemas/options.v1.schema.json):
 *
 *   {
 *     "schema_version": "cv_options.v1",
 *     "validate_during_creation": false,
 *     "spin": {"interval": "fine", "periodicity": "short", "entropy": "two"}
 *   }
 *
 * Every key except schema_version is optional and defaults as in Options.
 */

#include "cvec/common.hpp"
#include "cvec/options.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cvec::config {

constexpr std::string_view kOptionsSchemaVersion = "cv_options.v1";
constexpr std::string_view kOptionsSchemaFile = "options.v1.schema.json";

/**
 * Convert a JSON document to Options without schema validation.
 * @return Options or InvalidConfig
 */
[[nodiscard]] cvec::Result<Options> options_from_json(const nlohmann::json& j);

/**
 * Read, schema-check and convert an options file.
 * @param path JSON options file
 * @param schema_dir Directory holding options.v1.schema.json
 */
[[nodiscard]] cvec::Result<Options> load_options(const std::filesystem::path& path,
                                                 const std::filesystem::path& schema_dir);

/**
 * Render Options as a document accepted by options_from_json.
 */
[[nodiscard]] nlohmann::json to_json(const Options& options);

[[nodiscard]] std::string_view to_string(SpinInterval interval) noexcept;
[[nodiscard]] std::string_view to_string(SpinPeriodicity periodicity) noexcept;
[[nodiscard]] std::string_view to_string(SpinEntropy entropy) noexcept;

}  // namespace cvec::config
