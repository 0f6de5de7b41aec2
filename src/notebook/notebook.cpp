#include "notebook/notebook.hpp"
#include "notebook/mime_types.hpp"
#include "core/base64.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>

namespace nbfs::notebook {

// ordered_json keeps MIME bundles in document order, which output file
// numbering depends on.
using json = nlohmann::ordered_json;

const char* cell_kind_name(CellKind kind) {
    switch (kind) {
    case CellKind::Code:     return "code";
    case CellKind::Markdown: return "markdown";
    case CellKind::Raw:      return "raw";
    }
    return "unknown";
}

const char* output_kind_name(OutputKind kind) {
    switch (kind) {
    case OutputKind::Stream:        return "stream";
    case OutputKind::DisplayData:   return "display_data";
    case OutputKind::ExecuteResult: return "execute_result";
    case OutputKind::Error:         return "error";
    }
    return "unknown";
}

namespace {

/// nbformat stores multiline text either as one string or as a list of
/// lines that already carry their trailing newlines.
std::optional<std::string> join_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (!value.is_array()) {
        return std::nullopt;
    }
    std::string result;
    for (const auto& line : value) {
        if (!line.is_string()) return std::nullopt;
        result += line.get_ref<const std::string&>();
    }
    return result;
}

std::optional<CellKind> parse_cell_kind(std::string_view type) {
    if (type == "code") return CellKind::Code;
    if (type == "markdown") return CellKind::Markdown;
    if (type == "raw") return CellKind::Raw;
    return std::nullopt;
}

std::optional<OutputKind> parse_output_kind(std::string_view type) {
    if (type == "stream") return OutputKind::Stream;
    if (type == "display_data") return OutputKind::DisplayData;
    if (type == "execute_result") return OutputKind::ExecuteResult;
    if (type == "error") return OutputKind::Error;
    return std::nullopt;
}

std::optional<Output> parse_stream(const json& entry) {
    auto name = entry.find("name");
    auto text = entry.find("text");
    if (name == entry.end() || !name->is_string() || text == entry.end()) {
        return std::nullopt;
    }
    auto joined = join_text(*text);
    if (!joined) return std::nullopt;

    Output out;
    out.kind = OutputKind::Stream;
    out.stream_name = name->get<std::string>();
    out.bundle.push_back({"text/plain", std::move(*joined), false});
    return out;
}

std::optional<Output> parse_rich(const json& entry, OutputKind kind) {
    auto data = entry.find("data");
    if (data == entry.end() || !data->is_object()) {
        return std::nullopt;
    }

    Output out;
    out.kind = kind;
    for (const auto& [mime, value] : data->items()) {
        MimeEntry mentry;
        mentry.mime_type = mime;
        if (auto joined = join_text(value)) {
            mentry.payload = std::move(*joined);
            mentry.binary = is_binary_mime(mime);
        } else {
            // JSON-valued representations (application/json, widget state)
            mentry.payload = value.dump();
        }
        out.bundle.push_back(std::move(mentry));
    }
    return out;
}

std::optional<Output> parse_error(const json& entry) {
    auto ename = entry.find("ename");
    auto evalue = entry.find("evalue");
    if (ename == entry.end() || !ename->is_string() ||
        evalue == entry.end() || !evalue->is_string()) {
        return std::nullopt;
    }

    std::string text = ename->get<std::string>() + ": " +
                       evalue->get<std::string>() + "\n";
    auto traceback = entry.find("traceback");
    if (traceback != entry.end() && traceback->is_array()) {
        for (const auto& line : *traceback) {
            if (!line.is_string()) continue;
            text += line.get_ref<const std::string&>();
            text += '\n';
        }
    }

    Output out;
    out.kind = OutputKind::Error;
    out.bundle.push_back({"text/plain", std::move(text), false});
    return out;
}

/// Replace base64 text of binary MIME entries with the decoded bytes.
/// Entries that do not decode are dropped, so they never get a file name.
void decode_binary(Output& out, size_t cell_index) {
    std::erase_if(out.bundle, [&](MimeEntry& entry) {
        if (!entry.binary) return false;
        auto decoded = base64::decode(entry.payload);
        if (!decoded) {
            spdlog::warn("cell {} output {}: dropping {} entry: {}",
                         cell_index, out.index, entry.mime_type,
                         decoded.error().message);
            return true;
        }
        entry.payload = std::move(decoded.value());
        return false;
    });
}

std::vector<Output> parse_outputs(const json& cell, size_t cell_index) {
    std::vector<Output> outputs;

    auto list = cell.find("outputs");
    if (list == cell.end()) return outputs;
    if (!list->is_array()) {
        spdlog::debug("cell {}: 'outputs' is not a list, ignoring",
                      cell_index);
        return outputs;
    }

    for (size_t j = 0; j < list->size(); j++) {
        const auto& entry = (*list)[j];
        std::optional<OutputKind> kind;
        if (entry.is_object()) {
            auto type = entry.find("output_type");
            if (type != entry.end() && type->is_string()) {
                kind = parse_output_kind(type->get_ref<const std::string&>());
            }
        }
        if (!kind) {
            spdlog::debug("cell {} output {}: unknown output shape, skipped",
                          cell_index, j);
            continue;
        }

        std::optional<Output> out;
        switch (*kind) {
        case OutputKind::Stream:
            out = parse_stream(entry);
            break;
        case OutputKind::DisplayData:
        case OutputKind::ExecuteResult:
            out = parse_rich(entry, *kind);
            break;
        case OutputKind::Error:
            out = parse_error(entry);
            break;
        }

        if (!out) {
            spdlog::debug("cell {} output {}: malformed {} output, skipped",
                          cell_index, j, output_kind_name(*kind));
            continue;
        }
        out->index = j;
        decode_binary(*out, cell_index);
        outputs.push_back(std::move(*out));
    }

    return outputs;
}

} // namespace

Result<NotebookPtr> parse_notebook(std::string_view bytes,
                                   const fs::path& source_path,
                                   fs::file_time_type mod_time) {
    auto doc = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (doc.is_discarded()) {
        return Error(ErrorKind::ParseError, "not valid JSON");
    }
    if (!doc.is_object()) {
        return Error(ErrorKind::ParseError, "top level is not an object");
    }

    auto nb = std::make_shared<Notebook>();
    nb->source_path = source_path;
    nb->last_loaded_mod_time = mod_time;

    auto major = doc.find("nbformat");
    if (major != doc.end() && major->is_number_integer()) {
        nb->nbformat = major->get<int>();
    }
    auto minor = doc.find("nbformat_minor");
    if (minor != doc.end() && minor->is_number_integer()) {
        nb->nbformat_minor = minor->get<int>();
    }
    if (nb->nbformat < 4) {
        return Error(ErrorKind::ParseError,
                     "unsupported nbformat " + std::to_string(nb->nbformat));
    }

    auto cells = doc.find("cells");
    if (cells == doc.end() || !cells->is_array()) {
        return Error(ErrorKind::ParseError, "missing 'cells' list");
    }

    nb->cells.reserve(cells->size());
    for (size_t i = 0; i < cells->size(); i++) {
        const auto& entry = (*cells)[i];
        if (!entry.is_object()) {
            return Error(ErrorKind::ParseError,
                         "cell " + std::to_string(i) + " is not an object");
        }

        auto type = entry.find("cell_type");
        if (type == entry.end() || !type->is_string()) {
            return Error(ErrorKind::ParseError,
                         "cell " + std::to_string(i) + " has no cell_type");
        }
        auto kind = parse_cell_kind(type->get_ref<const std::string&>());
        if (!kind) {
            return Error(ErrorKind::ParseError,
                         "cell " + std::to_string(i) + " has unknown cell_type '" +
                             type->get<std::string>() + "'");
        }

        Cell cell;
        cell.index = i;
        cell.kind = *kind;

        auto source = entry.find("source");
        if (source != entry.end()) {
            auto joined = join_text(*source);
            if (!joined) {
                return Error(ErrorKind::ParseError,
                             "cell " + std::to_string(i) + " has malformed source");
            }
            cell.source = std::move(*joined);
        }

        switch (cell.kind) {
        case CellKind::Code:
            cell.outputs = parse_outputs(entry, i);
            break;
        case CellKind::Markdown:
        case CellKind::Raw:
            if (entry.contains("outputs")) {
                spdlog::debug("{} cell {}: outputs ignored",
                              cell_kind_name(cell.kind), i);
            }
            break;
        }

        nb->cells.push_back(std::move(cell));
    }

    return NotebookPtr(std::move(nb));
}

} // namespace nbfs::notebook
