/**
 * @file config.hpp
 * @brief YAML-powered minimiser settings loader that absolutely slaps uwu
 *
 * every minimiser bounds its effort with iteration caps instead of wall-clock
 * limits. the caps (plus the line-search tolerance and the trace switch) live
 * in one plain struct that callers either default-construct or load from a
 * YAML document. the loader validates aggressively and bubbles up ergonomic
 * errors via std::expected, with breadcrumbs pointing at the offending key.
 *
 * schema (every key optional, unknown keys rejected):
 * @code{.yaml}
 * minimiser:
 *   max_bracket_iterations: 256
 *   max_brent_iterations: 1000
 *   max_powell_iterations: 1000
 *   max_conjugate_gradient_iterations: 1000
 *   tolerance: 1.4901161193847656e-08
 *   trace: false
 * @endcode
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.1
 *
 * @note yaml-cpp 0.7.0+ powers parsing but we stay dependency-light elsewhere
 *
 * example (basic usage):
 * @code
 * using mcm::config::load_settings_from_file;
 * auto settings_result = load_settings_from_file("assets/minimiser.yaml");
 * if (!settings_result) {
 *     std::cerr << "config error: " << settings_result.error().message << '\n';
 *     return EXIT_FAILURE;
 * }
 * auto value = mcm::min::find_powell(f, x, 1e-6, *settings_result);
 * @endcode
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "mcm/common/math.hpp"

namespace YAML
{
class Node;
} // namespace YAML

namespace mcm::config
{

/**
 * @brief config error payload with context breadcrumbs for days
 *
 * the loader never throws; context strings form a breadcrumb trail
 * (e.g. "minimiser", "tolerance") so YAML typos are painless to find.
 */
struct ConfigError
{
    std::string              message; ///< spicy human-readable error message uwu
    std::vector<std::string> context; ///< breadcrumb trail showing where things derailed
};

/**
 * @brief effort caps + knobs shared by every minimiser
 *
 * ✨ PURE FUNCTION ✨ (plain aggregate with immutable semantics when used correctly)
 *
 * the defaults are what the minimisers use when callers pass nothing.
 */
struct MinimiserSettings
{
    std::uint32_t max_bracket_iterations            = 256U;  ///< find_bracket expansion steps (>= 1)
    std::uint32_t max_brent_iterations              = 1000U; ///< find_brent narrowing steps (>= 1)
    std::uint32_t max_powell_iterations             = 1000U; ///< find_powell outer iterations (>= 1)
    std::uint32_t max_conjugate_gradient_iterations = 1000U; ///< FRPR outer iterations (>= 1)
    /// fractional Brent tolerance of each line minimisation, in (0, 1)
    double tolerance = std::sqrt(common::kUlpOne);
    bool   trace     = false; ///< print per-iteration diagnostics to stdout
};

/**
 * @brief convenience alias for the loader result type (std::expected wrapper)
 */
using SettingsResult = std::expected<MinimiserSettings, ConfigError>;

/**
 * @brief parses minimiser settings from a YAML file
 *
 * ⚠️ IMPURE FUNCTION (has side effects)
 *
 * this helper is impure because:
 * - hits the file system to read YAML
 * - depends on external state (file contents)
 *
 * @param[in] path filesystem location of YAML document
 * @return parsed settings or a ConfigError whose context starts with the path
 */
[[nodiscard]] auto load_settings_from_file(const std::filesystem::path &path) -> SettingsResult;

/**
 * @brief parses minimiser settings directly from a string buffer (test-friendly)
 *
 * ⚠️ IMPURE FUNCTION (depends on yaml-cpp's global state when parsing)
 */
[[nodiscard]] auto load_settings_from_string(std::string_view yaml_text) -> SettingsResult;

/**
 * @brief low-level parser for an already-loaded YAML document root
 *
 * an empty document (null root) yields the defaults.
 */
[[nodiscard]] auto parse_settings_node(const YAML::Node &root) -> SettingsResult;

} // namespace mcm::config
