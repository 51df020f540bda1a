#pragma once

/**
 * @file OperationRegistry.hpp
 * @brief Named operations with JSON-Schema parameter descriptors
 *
 * Built once by the orchestrator and passed to whatever dispatches calls
 * (CLI, gateway). Tests construct isolated registries.
 *
 * Example usage:
 * @code
 * OperationRegistry registry;
 * registry.Register({"health", "Simulator reachability", schema},
 *                   [&](const nlohmann::json &) { return orch.Health().ToJSON(); });
 * auto out = registry.Invoke("health", nlohmann::json::object());
 * @endcode
 */

#include <prism/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace prism {

struct OperationDescriptor {
    std::string name;
    std::string description;
    nlohmann::json parameters; ///< JSON Schema of the argument object

    [[nodiscard]] nlohmann::json ToJSON() const {
        return {{"name", name}, {"description", description}, {"parameters", parameters}};
    }
};

class OperationRegistry {
  public:
    using Handler = std::function<nlohmann::json(const nlohmann::json &)>;

    /**
     * @brief Register an operation
     * @throws ConfigError if the name is already registered
     */
    void Register(OperationDescriptor descriptor, Handler handler) {
        const std::string name = descriptor.name;
        if (entries_.count(name) > 0) {
            throw ConfigError("Operation already registered: '" + name + "'");
        }
        entries_.emplace(name, Entry{std::move(descriptor), std::move(handler)});
    }

    /**
     * @brief Dispatch an operation
     * @throws InvalidArgumentError if the name is not registered
     */
    nlohmann::json Invoke(const std::string &name, const nlohmann::json &args) const {
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            throw InvalidArgumentError("operation", "unknown operation '" + name +
                                                        "'. Registered: " + ListNamesString());
        }
        return it->second.handler(args.is_null() ? nlohmann::json::object() : args);
    }

    [[nodiscard]] bool Has(const std::string &name) const { return entries_.count(name) > 0; }

    /// Registered names, sorted
    [[nodiscard]] std::vector<std::string> Names() const {
        std::vector<std::string> names;
        names.reserve(entries_.size());
        for (const auto &pair : entries_) {
            names.push_back(pair.first);
        }
        return names;
    }

    [[nodiscard]] const OperationDescriptor &Descriptor(const std::string &name) const {
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            throw InvalidArgumentError("operation", "unknown operation '" + name + "'");
        }
        return it->second.descriptor;
    }

    [[nodiscard]] nlohmann::json DescriptorsJSON() const {
        nlohmann::json j = nlohmann::json::array();
        for (const auto &pair : entries_) {
            j.push_back(pair.second.descriptor.ToJSON());
        }
        return j;
    }

    [[nodiscard]] std::size_t size() const { return entries_.size(); }

  private:
    struct Entry {
        OperationDescriptor descriptor;
        Handler handler;
    };

    [[nodiscard]] std::string ListNamesString() const {
        std::string result;
        for (const auto &pair : entries_) {
            if (!result.empty())
                result += ", ";
            result += pair.first;
        }
        return result.empty() ? "(none)" : result;
    }

    std::map<std::string, Entry> entries_;
};

} // namespace prism
