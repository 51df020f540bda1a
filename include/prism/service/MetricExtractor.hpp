#pragma once

/**
 * @file MetricExtractor.hpp
 * @brief Named measurements from simulator output
 *
 * Structured output: the known numeric fields are copied. Unstructured text:
 * best-effort pattern match for margin and BER. A miss yields no metric.
 */

#include <prism/core/Results.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <regex>
#include <string>

namespace prism {

class MetricExtractor {
  public:
    static constexpr std::array<const char *, 4> kKnownMetrics = {"logic_margin", "ber_estimate",
                                                                  "power_mw", "contrast_db"};

    /// Numeric known fields of a JSON object
    [[nodiscard]] static MetricMap FromStructured(const nlohmann::json &output) {
        MetricMap metrics;
        if (!output.is_object()) {
            return metrics;
        }
        for (const char *name : kKnownMetrics) {
            auto it = output.find(name);
            if (it != output.end() && it->is_number()) {
                metrics[name] = it->get<double>();
            }
        }
        return metrics;
    }

    /// `margin: <num>` and `ber[_estimate]: <num>`, case-insensitive
    [[nodiscard]] static MetricMap FromText(const std::string &text) {
        static const std::regex margin_re(R"(margin[:=]\s*([0-9.]+))",
                                          std::regex::ECMAScript | std::regex::icase);
        static const std::regex ber_re(R"(ber[_\s-]?(estimate)?[:=]\s*([0-9.eE+-]+))",
                                       std::regex::ECMAScript | std::regex::icase);
        MetricMap metrics;
        std::smatch m;
        if (std::regex_search(text, m, margin_re)) {
            if (auto v = ParseFloat(m[1].str())) {
                metrics["logic_margin"] = *v;
            }
        }
        if (std::regex_search(text, m, ber_re)) {
            if (auto v = ParseFloat(m[2].str())) {
                metrics["ber_estimate"] = *v;
            }
        }
        return metrics;
    }

  private:
    /// Whole-string float parse; "1.2.3" or "-" are rejected
    static std::optional<double> ParseFloat(const std::string &s) {
        if (s.empty()) {
            return std::nullopt;
        }
        errno = 0;
        char *end = nullptr;
        double v = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size() || errno == ERANGE) {
            return std::nullopt;
        }
        return v;
    }
};

} // namespace prism
