#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "notebook/notebook.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nbfs::notebook {

/// Lazily parsed, modification-time-checked view of the notebooks in
/// one host directory. Safe to call from concurrent FUSE callbacks.
class NotebookRepository {
public:
    static constexpr const char* DEFAULT_EXTENSION = ".ipynb";

    explicit NotebookRepository(fs::path root,
                                std::string extension = DEFAULT_EXTENSION);

    /// Rescan the host directory. Returns notebook filenames in directory
    /// order and evicts cached notebooks whose file has gone.
    std::vector<std::string> list_names();

    /// Return the parsed notebook, reparsing when the host file's
    /// modification time differs from the cached one.
    /// Errors: NotFound (no such notebook), ParseError (malformed file).
    Result<NotebookPtr> get(std::string_view name);

    /// True for a plain filename (no separators) ending in the extension.
    bool is_notebook_name(std::string_view name) const;

    bool contains_cached(std::string_view name) const;
    size_t cached_count() const;

    const fs::path& root() const { return root_; }
    const std::string& extension() const { return extension_; }

private:
    fs::path root_;
    std::string extension_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, NotebookPtr> notebooks_;
    /// Modification time of files that last failed to parse, so a broken
    /// notebook is reported once rather than on every lookup.
    std::unordered_map<std::string, fs::file_time_type> failures_;
};

} // namespace nbfs::notebook
