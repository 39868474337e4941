/**
 * @file snapshot.cpp
 * @brief JSON views of vectors and errors
 */

#include "cvec/snapshot.hpp"

#include "cvec/version.hpp"

#include <format>
#include <string>

namespace cvec::snapshot {

nlohmann::json snapshot_json(const CorrelationVector& vector)
{
    return nlohmann::json{
        {"schema_version", std::string(kSnapshotSchemaVersion)},
        {          "tool", {{"name", "cvec"}, {"version", kLibraryVersion}, {"build", kBuildId}}},
        {         "value",                     vector.value()},
        {          "base",                      vector.base()},
        {     "extension",                 vector.extension()},
        {       "version",  std::format("{}", vector.version())},
        {     "immutable",              vector.is_immutable()}
    };
}

nlohmann::json error_json(const Error& error)
{
    return nlohmann::json{
        {   "code",    error.code},
        {"message", error.message}
    };
}

nlohmann::json parsed_json(const Parsed& parsed)
{
    auto j = snapshot_json(parsed.vector);
    if (parsed.error) {
        j["error"] = error_json(*parsed.error);
    }
    return j;
}

}  // namespace cvec::snapshot
