#include "transport/errno_map.hpp"

#include <cerrno>

namespace nbfs::transport {

int errno_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:      return ENOENT;
    case ErrorKind::IsADirectory:  return EISDIR;
    case ErrorKind::NotADirectory: return ENOTDIR;
    case ErrorKind::ParseError:    return ENOENT;
    case ErrorKind::ReadOnly:      return EROFS;
    case ErrorKind::Io:            return EIO;
    case ErrorKind::Config:        return EINVAL;
    }
    return EIO;
}

} // namespace nbfs::transport
