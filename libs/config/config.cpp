/**
 * @file config.cpp
 * @brief Options <-> JSON conversion with schema validation
 */

#include "cvec/config.hpp"

#include "cvec/schema_validate.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <optional>
#include <utility>

namespace cvec::config {

namespace {

template <typename Enum>
struct NamedValue
{
    std::string_view name;
    Enum value;
};

constexpr std::array<NamedValue<SpinInterval>, 3> kIntervals = {{
    {.name = "coarse", .value = SpinInterval::kCoarse},
    {.name = "medium", .value = SpinInterval::kMedium},
    {.name = "fine", .value = SpinInterval::kFine},
}};

constexpr std::array<NamedValue<SpinPeriodicity>, 4> kPeriodicities = {{
    {.name = "none", .value = SpinPeriodicity::kNone},
    {.name = "short", .value = SpinPeriodicity::kShort},
    {.name = "medium", .value = SpinPeriodicity::kMedium},
    {.name = "long", .value = SpinPeriodicity::kLong},
}};

constexpr std::array<NamedValue<SpinEntropy>, 5> kEntropies = {{
    {.name = "none", .value = SpinEntropy::kNone},
    {.name = "one", .value = SpinEntropy::kOne},
    {.name = "two", .value = SpinEntropy::kTwo},
    {.name = "three", .value = SpinEntropy::kThree},
    {.name = "four", .value = SpinEntropy::kFour},
}};

template <typename Enum, std::size_t N>
[[nodiscard]] std::optional<Enum> lookup(const std::array<NamedValue<Enum>, N>& table,
                                         std::string_view name)
{
    auto it = std::ranges::find(table, name, &NamedValue<Enum>::name);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->value;
}

template <typename Enum, std::size_t N>
[[nodiscard]] std::string_view name_of(const std::array<NamedValue<Enum>, N>& table, Enum value)
{
    auto it = std::ranges::find(table, value, &NamedValue<Enum>::value);
    return it == table.end() ? std::string_view{"unknown"} : it->name;
}

[[nodiscard]] Error invalid_config(std::string message)
{
    return Error::make(std::string(errc::kInvalidConfig), std::move(message));
}

template <typename Enum, std::size_t N>
[[nodiscard]] cvec::VoidResult read_enum(const nlohmann::json& spin,
                                         std::string_view key,
                                         const std::array<NamedValue<Enum>, N>& table,
                                         Enum& out)
{
    auto it = spin.find(std::string(key));
    if (it == spin.end()) {
        return {};
    }
    if (!it->is_string()) {
        return std::unexpected(invalid_config(std::format("spin.{} must be a string", key)));
    }
    auto name = it->get<std::string>();
    auto value = lookup(table, name);
    if (!value) {
        return std::unexpected(invalid_config(std::format("Unknown spin.{} '{}'", key, name)));
    }
    out = *value;
    return {};
}

}  // namespace

std::string_view to_string(SpinInterval interval) noexcept
{
    return name_of(kIntervals, interval);
}

std::string_view to_string(SpinPeriodicity periodicity) noexcept
{
    return name_of(kPeriodicities, periodicity);
}

std::string_view to_string(SpinEntropy entropy) noexcept
{
    return name_of(kEntropies, entropy);
}

cvec::Result<Options> options_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(invalid_config("Options document must be a JSON object"));
    }

    Options options;

    if (auto it = j.find("validate_during_creation"); it != j.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(invalid_config("validate_during_creation must be a boolean"));
        }
        options.validate_during_creation = it->get<bool>();
    }

    if (auto it = j.find("spin"); it != j.end()) {
        if (!it->is_object()) {
            return std::unexpected(invalid_config("spin must be an object"));
        }
        if (auto r = read_enum(*it, "interval", kIntervals, options.spin.interval); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_enum(*it, "periodicity", kPeriodicities, options.spin.periodicity); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_enum(*it, "entropy", kEntropies, options.spin.entropy); !r) {
            return std::unexpected(r.error());
        }
    }

    return options;
}

cvec::Result<Options> load_options(const std::filesystem::path& path,
                                   const std::filesystem::path& schema_dir)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("ConfigFileOpenFailed", "Failed to open options file: " + path.string()));
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "ConfigParseFailed", std::format("Failed to parse {}: {}", path.string(), ex.what())));
    }

    if (auto result = common::validate_json(document, schema_dir / kOptionsSchemaFile); !result) {
        return std::unexpected(Error::make(result.error().code,
                                           "Options schema validation failed: " +
                                               result.error().message));
    }

    return options_from_json(document);
}

nlohmann::json to_json(const Options& options)
{
    return nlohmann::json{
        {          "schema_version",        std::string(kOptionsSchemaVersion)},
        {"validate_during_creation",          options.validate_during_creation},
        {                    "spin",
         {{"interval", std::string(to_string(options.spin.interval))},
         {"periodicity", std::string(to_string(options.spin.periodicity))},
         {"entropy", std::string(to_string(options.spin.entropy))}}           }
    };
}

}  // namespace cvec::config
