#pragma once

#include "core/result.hpp"
#include "notebook/notebook_repository.hpp"
#include "vfs/virtual_entity.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nbfs::vfs {

/// Maps synthetic paths to VirtualEntity values and back.
///
/// Layout:
///   /                                  one directory per notebook
///   /<nb>.ipynb/cell{i}.{py,md,txt}    cell source
///   /<nb>.ipynb/cell{i}_out{j}_stdout.txt
///   /<nb>.ipynb/cell{i}_out{j}_data{k}{ext}
///   /<nb>.ipynb/cell{i}_out{j}_error.txt
class PathResolver {
public:
    explicit PathResolver(notebook::NotebookRepository& repository);

    /// Errors: NotFound, or ParseError for a malformed notebook.
    Result<VirtualEntity> resolve(std::string_view path) const;

    /// Children of a directory entity, in listing order.
    /// File entities fail with NotADirectory.
    Result<std::vector<DirEntry>> list_children(
        const VirtualEntity& entity) const;

    /// Name of the entity inside its parent directory ("" for root).
    static std::string entity_name(const VirtualEntity& entity);

    /// Canonical absolute path of an entity.
    static std::string entity_path(const VirtualEntity& entity);

    static std::string cell_file_name(const notebook::Cell& cell);
    static std::string output_file_name(const notebook::Cell& cell,
                                        const notebook::Output& output,
                                        size_t mime_index);

    /// Split "/a/b" into {"a", "b"}; repeated and trailing slashes are
    /// ignored. Returns nullopt for "." or ".." segments.
    static std::optional<std::vector<std::string>> split_path(
        std::string_view path);

private:
    notebook::NotebookRepository& repository_;
};

} // namespace nbfs::vfs
