#pragma once

#include <stdexcept>
#include <string>

namespace tinynotes::server {

enum class StoreErrc {
    kInvalidPath,
    kNotFound,
    kAlreadyExists,
    kIoFailure,
};

const char* to_string(StoreErrc code);

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrc code, const std::string& message) : std::runtime_error(message), code_(code) {}

    StoreErrc code() const noexcept { return code_; }

private:
    StoreErrc code_;
};

}  // namespace tinynotes::server
