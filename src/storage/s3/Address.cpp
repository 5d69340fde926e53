#include "storage/s3/Address.hpp"

#include <stdexcept>

namespace sk::storage::s3 {

bool isS3Url(const std::string_view address) { return address.starts_with(SCHEME); }

BucketKey bucketKeyFromS3Path(const std::string& s3Path) {
    if (!isS3Url(s3Path)) throw std::invalid_argument("Not an S3 URL: " + s3Path);

    const auto rest = std::string_view(s3Path).substr(SCHEME.size());
    const auto slash = rest.find('/');
    if (slash == std::string_view::npos) return {std::string(rest), {}};

    return {std::string(rest.substr(0, slash)), std::string(rest.substr(slash + 1))};
}

std::string toS3Path(const BucketKey& bk) {
    std::string out(SCHEME);
    out.append(bk.bucket).append("/").append(bk.key);
    return out;
}

}
