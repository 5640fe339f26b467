#include "editor/json_file_store.hpp"

#include <SDL_log.h>

#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_map>

namespace tumble::editor {
namespace {

struct PathHash {
    std::size_t operator()(const std::filesystem::path& p) const noexcept {
        return std::filesystem::hash_value(p);
    }
};

struct DigestEntry {
    std::filesystem::file_time_type mtime{};
    std::size_t hash{};
    nlohmann::json data = nlohmann::json::object();
};

void log_error(const std::string& message) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", message.c_str());
}

void log_info(const std::string& message) {
    SDL_Log("%s", message.c_str());
}

bool write_file(const std::filesystem::path& path,
                const std::string& payload,
                std::ostream& error_sink) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error_sink << "[JsonFileStore] Failed to create parent directory for '" << path.string() << "': " << ec.message();
            return false;
        }
    }

    const std::filesystem::path tmp_full = path.string() + ".tmp";

    std::filesystem::perms target_perms = std::filesystem::perms::unknown;
    const bool target_exists = std::filesystem::exists(path, ec);
    if (!ec && target_exists) {
        target_perms = std::filesystem::status(path, ec).permissions();
    }
    ec.clear();

    {
        std::ofstream out(tmp_full, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error_sink << "[JsonFileStore] Failed to open temp file '" << tmp_full.string() << "' for writing";
            return false;
        }
        out << payload;
        out.flush();
        if (!out.good()) {
            error_sink << "[JsonFileStore] Stream error while writing temp '" << tmp_full.string() << "'";
            return false;
        }
    }

    if (target_perms != std::filesystem::perms::unknown) {
        std::filesystem::permissions(tmp_full, target_perms, ec);
        ec.clear();
    }

    std::filesystem::rename(tmp_full, path, ec);
    if (ec) {
        error_sink << "[JsonFileStore] rename('" << tmp_full.string() << "' -> '" << path.string() << "') failed: " << ec.message();
        std::filesystem::remove(tmp_full, ec);
        return false;
    }
    return true;
}

}

struct JsonFileStore::Impl {
    nlohmann::json load(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (ec) {
                log_error("[JsonFileStore] exists(" + path.string() + ") failed: " + ec.message());
            }
            return nlohmann::json::object();
        }

        const auto file_time = std::filesystem::last_write_time(path, ec);
        if (ec) {
            log_error("[JsonFileStore] last_write_time(" + path.string() + ") failed: " + ec.message());
            return nlohmann::json::object();
        }

        std::ifstream in(path);
        if (!in.is_open()) {
            log_error("[JsonFileStore] Failed to open '" + path.string() + "' for reading");
            return nlohmann::json::object();
        }
        const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        const std::size_t hash = std::hash<std::string>{}(contents);

        // A rewrite inside the filesystem's mtime resolution keeps the old stamp.
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = digest_cache_.find(path);
            if (it != digest_cache_.end() && it->second.mtime == file_time && it->second.hash == hash) {
                return it->second.data;
            }
        }

        nlohmann::json parsed = nlohmann::json::parse(contents, nullptr, false);
        if (parsed.is_discarded()) {
            log_error("[JsonFileStore] '" + path.string() + "' is not valid JSON");
            parsed = nlohmann::json::object();
        } else if (!parsed.is_object()) {
            log_error("[JsonFileStore] '" + path.string() + "' does not hold a JSON object");
            parsed = nlohmann::json::object();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            digest_cache_[path] = DigestEntry{file_time, hash, parsed};
        }
        return parsed;
    }

    bool save(const std::filesystem::path& path, const nlohmann::json& data, int indent) {
        std::ostringstream errors;
        const std::string payload = data.dump(indent);
        if (!write_file(path, payload, errors)) {
            log_error(errors.str());
            return false;
        }
        std::error_code ec;
        auto mtime = std::filesystem::last_write_time(path, ec);
        if (ec) {
            mtime = std::filesystem::file_time_type::clock::now();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            digest_cache_[path] = DigestEntry{mtime, std::hash<std::string>{}(payload), data};
        }
        log_info("[JsonFileStore] Wrote '" + path.string() + "'");
        return true;
    }

    void clear_cache() {
        std::lock_guard<std::mutex> lock(mutex_);
        digest_cache_.clear();
    }

    std::mutex mutex_;
    std::unordered_map<std::filesystem::path, DigestEntry, PathHash> digest_cache_;
};

JsonFileStore& JsonFileStore::instance() {
    static JsonFileStore store;
    return store;
}

JsonFileStore::JsonFileStore()
    : impl_(new Impl()) {}

JsonFileStore::~JsonFileStore() {
    delete impl_;
}

nlohmann::json JsonFileStore::load(const std::filesystem::path& path) {
    return impl_->load(path);
}

bool JsonFileStore::save(const std::filesystem::path& path, const nlohmann::json& data, int indent) {
    return impl_->save(path, data, indent);
}

void JsonFileStore::clear_cache() {
    impl_->clear_cache();
}

}
