#pragma once

#include <string>
#include <string_view>

namespace nbfs::notebook {

/// File extension (with leading dot) for a MIME type. Unknown types get
/// ".bin".
std::string mime_extension(std::string_view mime_type);

/// Binary MIME types are stored base64-encoded inside notebooks.
bool is_binary_mime(std::string_view mime_type);

} // namespace nbfs::notebook
