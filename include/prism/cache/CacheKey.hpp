#pragma once

/**
 * @file CacheKey.hpp
 * @brief Content-addressed keys for evaluation results
 *
 * Cache identity covers every field that can change the simulator's output:
 * the operation name, threshold, beta, mode, the four optional physics values
 * (null when unset) and the sanitized extra flags as a sorted list. The
 * simulator's parser is last-wins, so a repeated `--name=value` flag only
 * contributes its final value before sorting. The canonical form is compact JSON with sorted object keys; the key is a
 * prefixed 64-bit FNV-1a digest of it, stable across processes.
 */

#include <prism/core/Params.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace prism {

/// 64-bit FNV-1a
[[nodiscard]] constexpr uint64_t Fnv1a64(std::string_view data) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (char c : data) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

/**
 * @brief Canonical serialization of the identity-relevant fields
 */
/**
 * @brief Extra flags in identity order
 *
 * `--name=value` flags keep only the last occurrence of each name; bare
 * flags are kept with their multiplicity. The result is sorted.
 */
[[nodiscard]] inline std::vector<std::string> CanonicalExtra(const std::vector<std::string> &extra) {
    std::vector<std::string> out;
    std::vector<std::string> seen_names;
    for (auto it = extra.rbegin(); it != extra.rend(); ++it) {
        const auto eq = it->find('=');
        if (eq != std::string::npos) {
            const std::string name = it->substr(0, eq);
            if (std::find(seen_names.begin(), seen_names.end(), name) != seen_names.end()) {
                continue;
            }
            seen_names.push_back(name);
        }
        out.push_back(*it);
    }
    std::sort(out.begin(), out.end());
    return out;
}

/**
 * @brief Canonical serialization of the identity-relevant fields
 */
[[nodiscard]] inline std::string CanonicalIdentity(const std::string &operation,
                                                   const EvaluationParams &params) {
    // nlohmann::json objects are ordered maps: dump() is key-sorted
    nlohmann::json j = params.ToJSON();
    j["extra"] = CanonicalExtra(params.extra());
    j["op"] = operation;
    return j.dump();
}

/**
 * @brief Derive the cache key for an operation on a parameter set
 * @return prefix + 16 lowercase hex digits
 */
[[nodiscard]] inline std::string DeriveKey(const std::string &operation,
                                           const EvaluationParams &params,
                                           const std::string &prefix = "prism:") {
    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx",
                  static_cast<unsigned long long>(Fnv1a64(CanonicalIdentity(operation, params))));
    return prefix + hex;
}

} // namespace prism
