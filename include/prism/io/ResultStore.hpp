#pragma once

/**
 * @file ResultStore.hpp
 * @brief Flat JSON result files under the results directory
 *
 * One file per run, named `<kind>_<run_id>.json`. Files are created
 * exclusively and never rewritten.
 */

#include <prism/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace prism {

class ResultStore {
  public:
    explicit ResultStore(std::string directory);

    [[nodiscard]] const std::string &directory() const { return directory_; }

    /// `<directory>/<kind>_<run_id>.json`
    [[nodiscard]] std::string PathFor(const std::string &kind, const std::string &run_id) const;

    /**
     * @brief Write a document for a run
     * @return Path of the created file
     * @throws IOError if the file already exists or cannot be written
     */
    std::string Write(const std::string &kind, const std::string &run_id,
                      const nlohmann::json &document) const;

    /// Read back a document written by Write()
    [[nodiscard]] static nlohmann::json Read(const std::string &path);

    /**
     * @brief Reserve a fresh, empty file under the results directory
     *
     * Used for simulator outputs the caller did not name (truth-table CSV).
     */
    [[nodiscard]] std::string ReserveTempFile(const std::string &stem,
                                              const std::string &extension) const;

  private:
    void EnsureDirectory() const;

    std::string directory_;
};

} // namespace prism
