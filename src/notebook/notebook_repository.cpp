#include "notebook/notebook_repository.hpp"

#include <fstream>
#include <optional>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace nbfs::notebook {

namespace {

std::optional<std::string> read_host_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return std::nullopt;
    }

    auto size = file.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    file.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (!file.read(buffer.data(), size)) {
        return std::nullopt;
    }

    return buffer;
}

} // namespace

NotebookRepository::NotebookRepository(fs::path root, std::string extension)
    : root_(std::move(root)), extension_(std::move(extension)) {}

bool NotebookRepository::is_notebook_name(std::string_view name) const {
    if (name.size() <= extension_.size()) return false;
    if (name.find('/') != std::string_view::npos) return false;
    return name.compare(name.size() - extension_.size(), extension_.size(),
                        extension_) == 0;
}

std::vector<std::string> NotebookRepository::list_names() {
    std::vector<std::string> names;

    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", root_.string(), ec.message());
        return names;
    }

    for (const auto& entry : it) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;

        auto name = entry.path().filename().string();
        if (is_notebook_name(name)) {
            names.push_back(std::move(name));
        }
    }

    // Evict notebooks that disappeared since the last scan
    std::unordered_set<std::string> present(names.begin(), names.end());
    std::lock_guard lock(mutex_);
    for (auto iter = notebooks_.begin(); iter != notebooks_.end();) {
        if (!present.contains(iter->first)) {
            spdlog::debug("Evicting {}: file removed", iter->first);
            iter = notebooks_.erase(iter);
        } else {
            ++iter;
        }
    }
    std::erase_if(failures_, [&](const auto& kv) {
        return !present.contains(kv.first);
    });

    return names;
}

Result<NotebookPtr> NotebookRepository::get(std::string_view name) {
    if (!is_notebook_name(name)) {
        return Error(ErrorKind::NotFound,
                     "not a notebook name: " + std::string(name));
    }

    std::string key(name);
    auto path = root_ / key;

    std::error_code ec;
    auto mod_time = fs::last_write_time(path, ec);
    if (ec || !fs::is_regular_file(path, ec)) {
        std::lock_guard lock(mutex_);
        notebooks_.erase(key);
        failures_.erase(key);
        return Error(ErrorKind::NotFound, "no such notebook: " + key);
    }

    {
        std::lock_guard lock(mutex_);
        auto cached = notebooks_.find(key);
        if (cached != notebooks_.end() &&
            cached->second->last_loaded_mod_time == mod_time) {
            return cached->second;
        }
        auto failed = failures_.find(key);
        if (failed != failures_.end() && failed->second == mod_time) {
            return Error(ErrorKind::ParseError,
                         key + ": previously failed to parse");
        }
    }

    // Parse outside the lock so one large notebook doesn't stall lookups
    // of the others.
    auto bytes = read_host_file(path);
    if (!bytes) {
        return Error(ErrorKind::NotFound, "cannot read notebook: " + key);
    }

    auto parsed = parse_notebook(*bytes, path, mod_time);

    std::lock_guard lock(mutex_);
    if (!parsed) {
        spdlog::warn("Failed to parse {}: {}", key, parsed.error().message);
        notebooks_.erase(key);
        failures_[key] = mod_time;
        return Error(ErrorKind::ParseError,
                     key + ": " + parsed.error().message);
    }

    failures_.erase(key);
    auto& slot = notebooks_[key];
    if (!slot || slot->last_loaded_mod_time != mod_time) {
        spdlog::debug("Loaded {} ({} cells)", key,
                      parsed.value()->cells.size());
        slot = parsed.value();
    }
    return slot;
}

bool NotebookRepository::contains_cached(std::string_view name) const {
    std::lock_guard lock(mutex_);
    return notebooks_.contains(std::string(name));
}

size_t NotebookRepository::cached_count() const {
    std::lock_guard lock(mutex_);
    return notebooks_.size();
}

} // namespace nbfs::notebook
