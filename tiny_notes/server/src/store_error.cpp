#include "store_error.hpp"

namespace tinynotes::server {

const char* to_string(StoreErrc code) {
    switch (code) {
        case StoreErrc::kInvalidPath:
            return "invalid_path";
        case StoreErrc::kNotFound:
            return "not_found";
        case StoreErrc::kAlreadyExists:
            return "already_exists";
        case StoreErrc::kIoFailure:
            return "io_failure";
        default:
            return "unknown";
    }
}

}  // namespace tinynotes::server
