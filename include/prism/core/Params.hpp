#pragma once

/**
 * @file Params.hpp
 * @brief Evaluation parameters for one simulator invocation
 *
 * EvaluationParams is immutable once constructed: build it from JSON (the
 * gateway's representation) or through the Builder, both of which validate.
 */

#include <prism/core/Error.hpp>
#include <prism/exec/ArgumentSanitizer.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace prism {

// =============================================================================
// Enumerations
// =============================================================================

enum class Threshold { Hard, Soft };

enum class XpmMode { Linear, Physics };

[[nodiscard]] inline const char *ToString(Threshold t) {
    return t == Threshold::Hard ? "hard" : "soft";
}

[[nodiscard]] inline const char *ToString(XpmMode m) {
    return m == XpmMode::Linear ? "linear" : "physics";
}

[[nodiscard]] inline Threshold ParseThreshold(const std::string &s) {
    if (s == "hard")
        return Threshold::Hard;
    if (s == "soft")
        return Threshold::Soft;
    throw InvalidArgumentError("threshold", "expected 'hard' or 'soft', got '" + s + "'");
}

[[nodiscard]] inline XpmMode ParseXpmMode(const std::string &s) {
    if (s == "linear")
        return XpmMode::Linear;
    if (s == "physics")
        return XpmMode::Physics;
    throw InvalidArgumentError("mode", "expected 'linear' or 'physics', got '" + s + "'");
}

/// Shortest round-trip decimal representation, as passed on the command line
[[nodiscard]] inline std::string FormatNumber(double v) {
    return nlohmann::json(v).dump();
}

// =============================================================================
// EvaluationParams
// =============================================================================

class EvaluationParams {
  public:
    static constexpr double kDefaultBeta = 30.0;
    static constexpr double kDefaultN2 = 1e-17;

    /// Defaults: soft threshold, beta 30, physics mode, n2 1e-17
    EvaluationParams() = default;

    [[nodiscard]] Threshold threshold() const { return threshold_; }
    [[nodiscard]] double beta() const { return beta_; }
    [[nodiscard]] XpmMode mode() const { return mode_; }
    [[nodiscard]] const std::optional<double> &n2() const { return n2_; }
    [[nodiscard]] const std::optional<double> &a_eff() const { return a_eff_; }
    [[nodiscard]] const std::optional<double> &n_eff() const { return n_eff_; }
    [[nodiscard]] const std::optional<double> &g_geom() const { return g_geom_; }
    [[nodiscard]] const std::vector<std::string> &extra() const { return extra_; }

    /**
     * @brief Simulator argument list for the `cascade` command
     *
     * Optional physics values are only passed when set.
     */
    [[nodiscard]] std::vector<std::string> ToCascadeArgs() const {
        std::vector<std::string> args = {"cascade",    "--threshold", ToString(threshold_),
                                         "--beta",     FormatNumber(beta_), "--xpm-mode",
                                         ToString(mode_)};
        auto push_opt = [&args](const char *flag, const std::optional<double> &v) {
            if (v) {
                args.emplace_back(flag);
                args.push_back(FormatNumber(*v));
            }
        };
        push_opt("--n2", n2_);
        push_opt("--a-eff", a_eff_);
        push_opt("--n-eff", n_eff_);
        push_opt("--g-geom", g_geom_);
        args.insert(args.end(), extra_.begin(), extra_.end());
        return args;
    }

    [[nodiscard]] nlohmann::json ToJSON() const {
        nlohmann::json j;
        j["threshold"] = ToString(threshold_);
        j["beta"] = beta_;
        j["mode"] = ToString(mode_);
        auto put_opt = [&j](const char *key, const std::optional<double> &v) {
            j[key] = v ? nlohmann::json(*v) : nlohmann::json(nullptr);
        };
        put_opt("n2", n2_);
        put_opt("a_eff", a_eff_);
        put_opt("n_eff", n_eff_);
        put_opt("g_geom", g_geom_);
        j["extra"] = extra_;
        return j;
    }

    /**
     * @brief Build from a JSON object
     *
     * Accepted keys: threshold, beta, mode (alias xpm_mode), n2, a_eff, n_eff,
     * g_geom, extra. Missing keys take defaults; an explicit null clears an
     * optional value.
     *
     * @throws InvalidArgumentError on unknown keys, bad enums or bad numbers
     */
    [[nodiscard]] static EvaluationParams FromJSON(const nlohmann::json &j);

    class Builder;

  private:
    static std::string RequireString(const nlohmann::json &j, const char *key) {
        if (!j[key].is_string()) {
            throw InvalidArgumentError(key, "expected a string");
        }
        return j[key].get<std::string>();
    }

    static double RequireNumber(const nlohmann::json &j, const char *key) {
        if (!j[key].is_number()) {
            throw InvalidArgumentError(key, "expected a number");
        }
        return j[key].get<double>();
    }

    static std::optional<double> OptionalNumber(const nlohmann::json &j, const char *key) {
        if (j[key].is_null()) {
            return std::nullopt;
        }
        return RequireNumber(j, key);
    }

    prism::Threshold threshold_ = prism::Threshold::Soft;
    double beta_ = kDefaultBeta;
    XpmMode mode_ = XpmMode::Physics;
    std::optional<double> n2_ = kDefaultN2;
    std::optional<double> a_eff_;
    std::optional<double> n_eff_;
    std::optional<double> g_geom_;
    std::vector<std::string> extra_;
};

/**
 * @brief Fluent construction with validation in Build()
 */
class EvaluationParams::Builder {
  public:
    Builder &Threshold(prism::Threshold t) {
        p_.threshold_ = t;
        return *this;
    }
    Builder &Beta(double beta) {
        p_.beta_ = beta;
        return *this;
    }
    Builder &Mode(XpmMode m) {
        p_.mode_ = m;
        return *this;
    }
    Builder &N2(std::optional<double> v) {
        p_.n2_ = v;
        return *this;
    }
    Builder &AEff(std::optional<double> v) {
        p_.a_eff_ = v;
        return *this;
    }
    Builder &NEff(std::optional<double> v) {
        p_.n_eff_ = v;
        return *this;
    }
    Builder &GGeom(std::optional<double> v) {
        p_.g_geom_ = v;
        return *this;
    }
    /// Flags are sanitized here; rejected ones never reach the params
    Builder &Extra(const std::vector<std::string> &flags) {
        p_.extra_ = ArgumentSanitizer::Sanitize(flags);
        return *this;
    }

    [[nodiscard]] EvaluationParams Build() const {
        if (!std::isfinite(p_.beta_) || p_.beta_ <= 0.0) {
            throw InvalidArgumentError("beta", "must be a finite value > 0, got " +
                                                   FormatNumber(p_.beta_));
        }
        CheckFinite("n2", p_.n2_);
        CheckFinite("a_eff", p_.a_eff_);
        CheckFinite("n_eff", p_.n_eff_);
        CheckFinite("g_geom", p_.g_geom_);
        return p_;
    }

  private:
    static void CheckFinite(const char *name, const std::optional<double> &v) {
        if (v && !std::isfinite(*v)) {
            throw InvalidArgumentError(name, "must be finite");
        }
    }

    EvaluationParams p_;
};

inline EvaluationParams EvaluationParams::FromJSON(const nlohmann::json &j) {
    if (!j.is_object()) {
        throw InvalidArgumentError("params", "expected a JSON object");
    }
    static const std::set<std::string> known = {"threshold", "beta",  "mode",   "xpm_mode",
                                                "n2",        "a_eff", "n_eff",  "g_geom",
                                                "extra"};
    for (const auto &item : j.items()) {
        if (known.count(item.key()) == 0) {
            throw InvalidArgumentError(item.key(), "unknown parameter");
        }
    }

    Builder b;
    if (j.contains("threshold")) {
        b.Threshold(ParseThreshold(RequireString(j, "threshold")));
    }
    if (j.contains("beta")) {
        b.Beta(RequireNumber(j, "beta"));
    }
    if (j.contains("mode")) {
        b.Mode(ParseXpmMode(RequireString(j, "mode")));
    } else if (j.contains("xpm_mode")) {
        b.Mode(ParseXpmMode(RequireString(j, "xpm_mode")));
    }
    if (j.contains("n2")) {
        b.N2(OptionalNumber(j, "n2"));
    }
    if (j.contains("a_eff")) {
        b.AEff(OptionalNumber(j, "a_eff"));
    }
    if (j.contains("n_eff")) {
        b.NEff(OptionalNumber(j, "n_eff"));
    }
    if (j.contains("g_geom")) {
        b.GGeom(OptionalNumber(j, "g_geom"));
    }
    if (j.contains("extra") && !j["extra"].is_null()) {
        const auto &extra = j["extra"];
        if (!extra.is_array()) {
            throw InvalidArgumentError("extra", "expected an array of strings");
        }
        std::vector<std::string> flags;
        for (const auto &e : extra) {
            flags.push_back(e.is_string() ? e.get<std::string>() : e.dump());
        }
        b.Extra(flags);
    }
    return b.Build();
}

} // namespace prism
