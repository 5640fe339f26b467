#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

namespace tumble::editor {

// Loads and atomically writes JSON documents. Reads are cached per path and
// invalidated by the file's modification time.
class JsonFileStore {
public:
    static JsonFileStore& instance();

    // Missing or unparseable files load as an empty object.
    nlohmann::json load(const std::filesystem::path& path);

    // Writes through a sibling temp file then renames over the target.
    bool save(const std::filesystem::path& path, const nlohmann::json& data, int indent = 4);

    void clear_cache();

private:
    JsonFileStore();
    ~JsonFileStore();

    JsonFileStore(const JsonFileStore&) = delete;
    JsonFileStore& operator=(const JsonFileStore&) = delete;

    struct Impl;
    Impl* impl_;
};

}
