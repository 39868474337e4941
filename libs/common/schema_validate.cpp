/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "cvec/schema_validate.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <string>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace cvec::common {

namespace {

// valijson resolves draft-07 "definitions"; map 2020-12 "$defs" onto it.
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (auto defs = schema.find("$defs"); defs != schema.end() && !schema.contains("definitions")) {
        schema["definitions"] = *defs;
        schema.erase("$defs");
    }
    std::vector<std::string> keys;
    keys.reserve(schema.size());
    for (const auto& item : schema.items()) {
        keys.push_back(item.key());
    }
    for (const auto& key : keys) {
        nlohmann::json& value = schema.at(key);
        if (key == "$ref" && value.is_string()) {
            constexpr std::string_view kPrefix = "#/$defs/";
            auto ref = value.get<std::string>();
            if (ref.starts_with(kPrefix)) {
                value = "#/definitions/" + ref.substr(kPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] std::string describe(valijson::ValidationResults& results)
{
    std::vector<std::string> lines;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        lines.push_back(std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description));
    }

    std::string joined;
    for (const auto& line : lines) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += line;
    }
    return joined;
}

}  // namespace

cvec::VoidResult validate_json(const nlohmann::json& j, const std::filesystem::path& schema_path)
{
    std::ifstream in(schema_path);
    if (!in) {
        return std::unexpected(Error::make("SchemaFileOpenFailed",
                                           "Failed to open schema file: " + schema_path.string()));
    }

    nlohmann::json schema_json;
    try {
        in >> schema_json;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("SchemaParseFailed",
                        std::format("Failed to parse schema {}: {}", schema_path.string(), ex.what())));
    }
    rewrite_defs(schema_json);

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(schema, target, &results)) {
        auto message = describe(results);
        if (message.empty()) {
            message = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(message)));
    }
    return {};
}

}  // namespace cvec::common
