#include <prism/core/CoreTypes.hpp>
#include <prism/io/ResultStore.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace prism {

namespace {

/// fopen "x" mode: fails with EEXIST instead of truncating
std::FILE *OpenExclusive(const std::string &path) { return std::fopen(path.c_str(), "wx"); }

} // namespace

ResultStore::ResultStore(std::string directory) : directory_(std::move(directory)) {}

std::string ResultStore::PathFor(const std::string &kind, const std::string &run_id) const {
    return (std::filesystem::path(directory_) / (kind + "_" + run_id + ".json")).string();
}

std::string ResultStore::Write(const std::string &kind, const std::string &run_id,
                               const nlohmann::json &document) const {
    EnsureDirectory();
    auto path = PathFor(kind, run_id);

    std::FILE *file = OpenExclusive(path);
    if (file == nullptr) {
        throw IOError("create", path, std::strerror(errno));
    }
    const std::string text = document.dump(2);
    const std::size_t written = std::fwrite(text.data(), 1, text.size(), file);
    const bool closed = std::fclose(file) == 0;
    if (written != text.size() || !closed) {
        throw IOError("write", path, "short write");
    }
    return path;
}

nlohmann::json ResultStore::Read(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw IOError("open", path, "cannot open for reading");
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error &e) {
        throw IOError("parse", path, e.what());
    }
}

std::string ResultStore::ReserveTempFile(const std::string &stem,
                                         const std::string &extension) const {
    EnsureDirectory();
    auto path =
        (std::filesystem::path(directory_) / (stem + "_" + NewRunId() + extension)).string();
    std::FILE *file = OpenExclusive(path);
    if (file == nullptr) {
        throw IOError("create", path, std::strerror(errno));
    }
    if (std::fclose(file) != 0) {
        throw IOError("close", path, std::strerror(errno));
    }
    return path;
}

void ResultStore::EnsureDirectory() const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw IOError("mkdir", directory_, ec.message());
    }
}

} // namespace prism
