#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nbfs::notebook {

enum class CellKind {
    Code,
    Markdown,
    Raw,
};

enum class OutputKind {
    Stream,
    DisplayData,
    ExecuteResult,
    Error,
};

const char* cell_kind_name(CellKind kind);
const char* output_kind_name(OutputKind kind);

/// One representation inside an output's MIME bundle.
struct MimeEntry {
    std::string mime_type;
    std::string payload; ///< File content; binary types already decoded
    bool binary = false; ///< Decoded from base64 at parse time
};

struct Output {
    size_t index = 0; ///< Position in the cell's output list
    OutputKind kind = OutputKind::Stream;
    std::string stream_name;       ///< "stdout"/"stderr", streams only
    std::vector<MimeEntry> bundle; ///< Document order
};

struct Cell {
    size_t index = 0;
    CellKind kind = CellKind::Code;
    std::string source;
    std::vector<Output> outputs; ///< Always empty unless kind == Code
};

/// One parsed .ipynb document. Never mutated after parse_notebook()
/// returns; a changed file produces a new instance.
struct Notebook {
    std::vector<Cell> cells;
    fs::path source_path;
    fs::file_time_type last_loaded_mod_time{};
    int nbformat = 4;
    int nbformat_minor = 0;
};

using NotebookPtr = std::shared_ptr<const Notebook>;

/// Parse the JSON bytes of an nbformat 4 notebook.
/// Output entries of an unknown shape and binary MIME entries that are not
/// valid base64 are skipped; a missing cell list, a cell without cell_type
/// or an unknown cell_type fail the whole parse.
Result<NotebookPtr> parse_notebook(std::string_view bytes,
                                   const fs::path& source_path = {},
                                   fs::file_time_type mod_time = {});

} // namespace nbfs::notebook
