#pragma once

#include "core/result.hpp"

namespace nbfs::transport {

/// Positive errno value reported to the kernel for an error kind.
/// Malformed notebooks look like missing ones.
int errno_for(ErrorKind kind);

} // namespace nbfs::transport
