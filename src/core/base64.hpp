#pragma once

#include "core/result.hpp"

#include <string>
#include <string_view>

namespace nbfs::base64 {

/// Decode standard (RFC 4648) base64. Whitespace, including the line
/// breaks notebooks insert into long payloads, is ignored. Padding is
/// optional.
Result<std::string> decode(std::string_view text);

std::string encode(std::string_view bytes);

} // namespace nbfs::base64
