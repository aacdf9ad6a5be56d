#include "download.hpp"

namespace download_service {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation: return "validation";
    case ErrorKind::Directory: return "directory";
    case ErrorKind::AcceleratorUnavailable: return "accelerator_unavailable";
    case ErrorKind::Engine: return "engine";
    case ErrorKind::OutputNotFound: return "output_not_found";
    case ErrorKind::Cancelled: return "cancelled";
    case ErrorKind::Internal: return "internal";
  }
  return "unknown";
}

}
