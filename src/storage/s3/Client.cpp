#include "storage/s3/Client.hpp"

#include <fmt/format.h>
#include <utility>

namespace sk::storage::s3 {

ClientError::ClientError(std::string code, const long httpStatus, const std::string& message)
    : std::runtime_error(fmt::format("S3 error {} (HTTP {}): {}", code, httpStatus, message)),
      code_(std::move(code)), httpStatus_(httpStatus) {}

bool ClientError::notFound() const noexcept {
    return httpStatus_ == 404 || code_ == "404" || code_ == "NoSuchKey" || code_ == "NotFound";
}

}
