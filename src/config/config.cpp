/**
 * @file config.cpp
 * @brief implementation of the YAML settings loader with bougie validation uwu
 *
 * this translation unit backs config.hpp with the YAML parsing pipeline. it
 * leans on yaml-cpp, wraps everything in std::expected, and emits error
 * breadcrumbs so humans can fix typos without doom scrolling logs.
 */
#include "mcm/config/config.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace mcm::config
{
namespace
{

constexpr std::string_view kRootKey = "minimiser";

constexpr std::array<std::string_view, 6> kKnownKeys = {
    "max_bracket_iterations", "max_brent_iterations", "max_powell_iterations", "max_conjugate_gradient_iterations",
    "tolerance",              "trace"};

[[nodiscard]] auto make_error(std::string message, std::vector<std::string> ctx) -> SettingsResult
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto is_known_key(std::string_view key) -> bool
{
    for (const auto known : kKnownKeys)
    {
        if (known == key)
        {
            return true;
        }
    }
    return false;
}

/// reads an optional iteration cap into `target`; absent keys keep the default
[[nodiscard]] auto read_count(const YAML::Node &section, std::string_view key, std::uint32_t &target)
    -> std::expected<void, ConfigError>
{
    const auto node = section[std::string(key)];
    if (!node)
    {
        return {};
    }
    std::vector<std::string> ctx{std::string(kRootKey), std::string(key)};
    long long                value = 0;
    try
    {
        value = node.as<long long>();
    }
    catch (const YAML::Exception &ex)
    {
        return std::unexpected(ConfigError{ex.what(), std::move(ctx)});
    }
    if (value < 1 || value > static_cast<long long>(std::numeric_limits<std::uint32_t>::max()))
    {
        return std::unexpected(ConfigError{fmt::format("{}.{} must be in [1, {}] (got {})", kRootKey, key,
                                                       std::numeric_limits<std::uint32_t>::max(), value),
                                           std::move(ctx)});
    }
    target = static_cast<std::uint32_t>(value);
    return {};
}

} // namespace

auto load_settings_from_file(const std::filesystem::path &path) -> SettingsResult
{
    try
    {
        const auto node = YAML::LoadFile(path.string());
        auto       result = parse_settings_node(node);
        if (!result)
        {
            auto error = result.error();
            error.context.insert(error.context.begin(), path.string());
            return std::unexpected(std::move(error));
        }
        return result;
    }
    catch (const YAML::BadFile &ex)
    {
        return make_error(fmt::format("unable to open config file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(fmt::format("YAML parse error: {}", ex.what()), {path.string()});
    }
}

auto load_settings_from_string(std::string_view yaml_text) -> SettingsResult
{
    try
    {
        const auto node = YAML::Load(std::string(yaml_text));
        return parse_settings_node(node);
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(fmt::format("YAML parse error: {}", ex.what()), {});
    }
}

auto parse_settings_node(const YAML::Node &root) -> SettingsResult
{
    MinimiserSettings settings{};

    if (!root || root.IsNull())
    {
        return settings;
    }
    if (!root.IsMap())
    {
        return make_error("settings root must be a mapping", {});
    }

    const auto section = root[std::string(kRootKey)];
    if (!section || section.IsNull())
    {
        return settings;
    }
    if (!section.IsMap())
    {
        return make_error("minimiser section must be a mapping", {std::string(kRootKey)});
    }

    for (const auto &item : section)
    {
        const auto key = item.first.as<std::string>();
        if (!is_known_key(key))
        {
            return make_error(fmt::format("unknown key '{}'", key), {std::string(kRootKey), key});
        }
    }

    // iteration caps
    for (const auto &[key, target] :
         {std::pair<std::string_view, std::uint32_t *>{"max_bracket_iterations", &settings.max_bracket_iterations},
          std::pair<std::string_view, std::uint32_t *>{"max_brent_iterations", &settings.max_brent_iterations},
          std::pair<std::string_view, std::uint32_t *>{"max_powell_iterations", &settings.max_powell_iterations},
          std::pair<std::string_view, std::uint32_t *>{"max_conjugate_gradient_iterations",
                                                       &settings.max_conjugate_gradient_iterations}})
    {
        auto count_result = read_count(section, key, *target);
        if (!count_result)
        {
            return std::unexpected(count_result.error());
        }
    }

    // line-search tolerance
    const auto tolerance_node = section["tolerance"];
    if (tolerance_node)
    {
        try
        {
            settings.tolerance = tolerance_node.as<double>();
        }
        catch (const YAML::Exception &ex)
        {
            return make_error(ex.what(), {std::string(kRootKey), "tolerance"});
        }
        if (!(0.0 < settings.tolerance && settings.tolerance < 1.0))
        {
            return make_error("minimiser.tolerance must be in (0,1)", {std::string(kRootKey), "tolerance"});
        }
    }

    // diagnostics
    const auto trace_node = section["trace"];
    if (trace_node)
    {
        try
        {
            settings.trace = trace_node.as<bool>();
        }
        catch (const YAML::Exception &ex)
        {
            return make_error(ex.what(), {std::string(kRootKey), "trace"});
        }
    }

    return settings;
}

} // namespace mcm::config
