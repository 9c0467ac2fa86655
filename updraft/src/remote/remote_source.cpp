#include "updraft/remote/remote_source.h"

namespace updraft {

std::string to_string(RemoteErrorCode code) {
    switch (code) {
        case RemoteErrorCode::UNAVAILABLE:       return "unavailable";
        case RemoteErrorCode::MALFORMED_RELEASE: return "malformed_release";
        case RemoteErrorCode::TRANSFER_FAILED:   return "transfer_failed";
        default: return "unknown";
    }
}

} // namespace updraft
