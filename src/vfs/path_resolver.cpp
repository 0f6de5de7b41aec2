#include "vfs/path_resolver.hpp"
#include "notebook/mime_types.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <type_traits>
#include <unordered_set>

namespace nbfs::vfs {

namespace {

const char* cell_extension(notebook::CellKind kind) {
    switch (kind) {
    case notebook::CellKind::Code:     return "py";
    case notebook::CellKind::Markdown: return "md";
    case notebook::CellKind::Raw:      return "txt";
    }
    return "txt";
}

/// Visit every file of a notebook directory in listing order: each cell,
/// then that cell's outputs and their MIME entries. The visitor returns
/// true to stop early.
template <typename Visitor>
void for_each_child(const std::string& name,
                    const notebook::NotebookPtr& nb, Visitor&& visit) {
    for (const auto& cell : nb->cells) {
        if (visit(PathResolver::cell_file_name(cell),
                  VirtualEntity(CellFileEntity{name, nb, cell.index}))) {
            return;
        }
        for (size_t slot = 0; slot < cell.outputs.size(); slot++) {
            const auto& output = cell.outputs[slot];
            for (size_t k = 0; k < output.bundle.size(); k++) {
                if (visit(PathResolver::output_file_name(cell, output, k),
                          VirtualEntity(OutputFileEntity{
                              name, nb, cell.index, slot, k}))) {
                    return;
                }
            }
        }
    }
}

} // namespace

PathResolver::PathResolver(notebook::NotebookRepository& repository)
    : repository_(repository) {}

std::string PathResolver::cell_file_name(const notebook::Cell& cell) {
    return "cell" + std::to_string(cell.index) + "." +
           cell_extension(cell.kind);
}

std::string PathResolver::output_file_name(const notebook::Cell& cell,
                                           const notebook::Output& output,
                                           size_t mime_index) {
    std::string prefix = "cell" + std::to_string(cell.index) + "_out" +
                         std::to_string(output.index) + "_";

    switch (output.kind) {
    case notebook::OutputKind::Stream: {
        std::string label =
            output.stream_name.empty() ? "stream" : output.stream_name;
        std::replace(label.begin(), label.end(), '/', '_');
        return prefix + label + ".txt";
    }
    case notebook::OutputKind::DisplayData:
    case notebook::OutputKind::ExecuteResult:
        return prefix + "data" + std::to_string(mime_index) +
               notebook::mime_extension(output.bundle[mime_index].mime_type);
    case notebook::OutputKind::Error:
        return prefix + "error.txt";
    }
    return prefix + "data" + std::to_string(mime_index) + ".bin";
}

std::optional<std::vector<std::string>> PathResolver::split_path(
    std::string_view path) {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos < path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        if (next > pos) {
            auto segment = path.substr(pos, next - pos);
            if (segment == "." || segment == "..") {
                return std::nullopt;
            }
            segments.emplace_back(segment);
        }
        pos = next + 1;
    }
    return segments;
}

std::string PathResolver::entity_name(const VirtualEntity& entity) {
    return std::visit(
        [](const auto& e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, RootEntity>) {
                return {};
            } else if constexpr (std::is_same_v<T, NotebookDirEntity>) {
                return e.notebook;
            } else if constexpr (std::is_same_v<T, CellFileEntity>) {
                return cell_file_name(e.snapshot->cells[e.cell]);
            } else {
                const auto& cell = e.snapshot->cells[e.cell];
                return output_file_name(cell, cell.outputs[e.output], e.mime);
            }
        },
        entity);
}

std::string PathResolver::entity_path(const VirtualEntity& entity) {
    return std::visit(
        [&](const auto& e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, RootEntity>) {
                return "/";
            } else if constexpr (std::is_same_v<T, NotebookDirEntity>) {
                return "/" + e.notebook;
            } else {
                return "/" + e.notebook + "/" + entity_name(entity);
            }
        },
        entity);
}

Result<VirtualEntity> PathResolver::resolve(std::string_view path) const {
    auto segments = split_path(path);
    if (!segments || segments->size() > 2) {
        return Error(ErrorKind::NotFound,
                     "no such path: " + std::string(path));
    }
    if (segments->empty()) {
        return VirtualEntity(RootEntity{});
    }

    const auto& nb_name = (*segments)[0];
    auto nb = repository_.get(nb_name);
    if (!nb) {
        return nb.error();
    }

    if (segments->size() == 1) {
        return VirtualEntity(NotebookDirEntity{nb_name, nb.value()});
    }

    // Name-exact linear match; on a naming collision the first entry wins
    const auto& child = (*segments)[1];
    std::optional<VirtualEntity> found;
    for_each_child(nb_name, nb.value(),
                   [&](const std::string& name, VirtualEntity entity) {
                       if (name != child) return false;
                       found = std::move(entity);
                       return true;
                   });

    if (!found) {
        return Error(ErrorKind::NotFound,
                     "no such path: " + std::string(path));
    }
    return std::move(*found);
}

Result<std::vector<DirEntry>> PathResolver::list_children(
    const VirtualEntity& entity) const {
    std::vector<DirEntry> children;

    if (std::holds_alternative<RootEntity>(entity)) {
        for (auto& name : repository_.list_names()) {
            children.push_back({std::move(name), EntryKind::Directory});
        }
        return children;
    }

    const auto* dir = std::get_if<NotebookDirEntity>(&entity);
    if (!dir) {
        return Error(ErrorKind::NotADirectory,
                     entity_path(entity) + " is not a directory");
    }

    std::unordered_set<std::string> seen;
    for_each_child(dir->notebook, dir->snapshot,
                   [&](const std::string& name, const VirtualEntity&) {
                       if (!seen.insert(name).second) {
                           spdlog::warn("{}: duplicate entry '{}' is "
                                        "unreachable by path",
                                        dir->notebook, name);
                       }
                       children.push_back({name, EntryKind::File});
                       return false;
                   });
    return children;
}

} // namespace nbfs::vfs
