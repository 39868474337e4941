#include "cvec/snapshot.hpp"

#include "cvec/schema_validate.hpp"
#include "cvec/version.hpp"

#include <filesystem>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace cvec::snapshot::test {

namespace {

std::filesystem::path snapshot_schema()
{
    return std::filesystem::path(CVEC_SCHEMA_DIR) / "snapshot.v1.schema.json";
}

}  // namespace

TEST(SnapshotTest, DescribesVector)
{
    auto parsed = CorrelationVector::parse("KZY+dsX2jEaZesgCPjJ2Ng.1.7");
    ASSERT_TRUE(parsed);

    auto j = snapshot_json(parsed->vector);
    EXPECT_EQ(j.at("schema_version"), "cv_snapshot.v1");
    EXPECT_EQ(j.at("tool").at("version"), kLibraryVersion);
    EXPECT_EQ(j.at("value"), "KZY+dsX2jEaZesgCPjJ2Ng.1.7");
    EXPECT_EQ(j.at("base"), "KZY+dsX2jEaZesgCPjJ2Ng.1");
    EXPECT_EQ(j.at("extension"), 7);
    EXPECT_EQ(j.at("version"), "V2");
    EXPECT_EQ(j.at("immutable"), false);

    auto valid = common::validate_json(j, snapshot_schema());
    EXPECT_TRUE(valid) << valid.error().message;
}

TEST(SnapshotTest, ImmutableVector)
{
    auto parsed = CorrelationVector::parse("tul4NUsfs9Cl7mOf.3!");
    ASSERT_TRUE(parsed);
    auto j = snapshot_json(parsed->vector);
    EXPECT_EQ(j.at("value"), "tul4NUsfs9Cl7mOf.3!");
    EXPECT_EQ(j.at("immutable"), true);
    EXPECT_TRUE(common::validate_json(j, snapshot_schema()));
}

TEST(SnapshotTest, ParsedCarriesRecoverableError)
{
    auto extended = CorrelationVector::extend("short.1");
    ASSERT_TRUE(extended);
    auto j = parsed_json(*extended);
    ASSERT_TRUE(j.contains("error"));
    EXPECT_EQ(j.at("error").at("code"), "InvalidFormat");
    EXPECT_TRUE(common::validate_json(j, snapshot_schema()));

    auto clean = CorrelationVector::extend("tul4NUsfs9Cl7mOf.1");
    ASSERT_TRUE(clean);
    EXPECT_FALSE(parsed_json(*clean).contains("error"));
}

TEST(SnapshotTest, ErrorJson)
{
    auto j = error_json(Error::make("InvalidExtension", "bad tail"));
    EXPECT_EQ(j, (nlohmann::json{{"code", "InvalidExtension"}, {"message", "bad tail"}}));
}

TEST(SnapshotTest, SchemaRejectsForeignDocuments)
{
    nlohmann::json j = {
        {"schema_version", "cv_snapshot.v1"},
        {"value", "x"}
    };
    auto result = common::validate_json(j, snapshot_schema());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

}  // namespace cvec::snapshot::test
