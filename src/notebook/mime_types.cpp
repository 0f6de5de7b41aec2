#include "notebook/mime_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace nbfs::notebook {

namespace {

struct MimeInfo {
    std::string_view mime;
    std::string_view extension;
    bool binary;
};

constexpr std::array<MimeInfo, 15> MIME_TABLE = {{
    {"text/plain", ".txt", false},
    {"text/html", ".html", false},
    {"text/markdown", ".md", false},
    {"text/latex", ".tex", false},
    {"text/csv", ".csv", false},
    {"image/png", ".png", true},
    {"image/jpeg", ".jpg", true},
    {"image/gif", ".gif", true},
    {"image/webp", ".webp", true},
    {"image/bmp", ".bmp", true},
    {"image/svg+xml", ".svg", false},
    {"application/pdf", ".pdf", true},
    {"application/json", ".json", false},
    {"application/javascript", ".js", false},
    {"text/javascript", ".js", false},
}};

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/// Drop parameters such as "; charset=utf-8".
std::string_view strip_parameters(std::string_view mime) {
    auto semi = mime.find(';');
    if (semi != std::string_view::npos) mime = mime.substr(0, semi);
    while (!mime.empty() && mime.back() == ' ') mime.remove_suffix(1);
    return mime;
}

const MimeInfo* lookup(std::string_view mime_type) {
    auto key = to_lower(strip_parameters(mime_type));
    for (const auto& info : MIME_TABLE) {
        if (info.mime == key) return &info;
    }
    return nullptr;
}

} // namespace

std::string mime_extension(std::string_view mime_type) {
    if (const auto* info = lookup(mime_type)) {
        return std::string(info->extension);
    }

    // Structured-syntax suffix, e.g. application/vnd.plotly.v1+json
    auto key = to_lower(strip_parameters(mime_type));
    if (key.size() > 5 && key.compare(key.size() - 5, 5, "+json") == 0) {
        return ".json";
    }
    return ".bin";
}

bool is_binary_mime(std::string_view mime_type) {
    const auto* info = lookup(mime_type);
    return info && info->binary;
}

} // namespace nbfs::notebook
