#include "types.hpp"

namespace plsync {

const char *toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ScopeUnavailable:
    return "ScopeUnavailable";
  case ErrorKind::PlaylistReadFailure:
    return "PlaylistReadFailure";
  case ErrorKind::PlaylistWriteFailure:
    return "PlaylistWriteFailure";
  }
  return "Unknown";
}

} // namespace plsync
