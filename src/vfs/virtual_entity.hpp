#pragma once

#include "notebook/notebook.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace nbfs::vfs {

// Non-root entities name their target by key (notebook filename and
// positions) and pin the notebook snapshot they were resolved against, so
// a concurrent reload never leaves an in-flight request dangling.

struct RootEntity {
    bool operator==(const RootEntity&) const = default;
};

struct NotebookDirEntity {
    std::string notebook;
    notebook::NotebookPtr snapshot;

    bool operator==(const NotebookDirEntity&) const = default;
};

struct CellFileEntity {
    std::string notebook;
    notebook::NotebookPtr snapshot;
    size_t cell = 0;

    bool operator==(const CellFileEntity&) const = default;
};

struct OutputFileEntity {
    std::string notebook;
    notebook::NotebookPtr snapshot;
    size_t cell = 0;
    size_t output = 0; ///< Position in Cell::outputs (not Output::index)
    size_t mime = 0;   ///< Position in Output::bundle

    bool operator==(const OutputFileEntity&) const = default;
};

using VirtualEntity = std::variant<RootEntity, NotebookDirEntity,
                                   CellFileEntity, OutputFileEntity>;

enum class EntryKind {
    File,
    Directory,
};

struct DirEntry {
    std::string name;
    EntryKind kind = EntryKind::File;
};

inline EntryKind entity_kind(const VirtualEntity& entity) {
    return std::holds_alternative<RootEntity>(entity) ||
                   std::holds_alternative<NotebookDirEntity>(entity)
               ? EntryKind::Directory
               : EntryKind::File;
}

/// Notebook snapshot an entity was resolved against; nullptr for root.
inline const notebook::NotebookPtr* entity_snapshot(const VirtualEntity& entity) {
    return std::visit(
        [](const auto& e) -> const notebook::NotebookPtr* {
            if constexpr (std::is_same_v<std::decay_t<decltype(e)>, RootEntity>) {
                return nullptr;
            } else {
                return &e.snapshot;
            }
        },
        entity);
}

} // namespace nbfs::vfs
