#pragma once

#include <string>
#include <string_view>

namespace sk::storage::s3 {

inline constexpr std::string_view SCHEME = "s3://";

struct BucketKey {
    std::string bucket;
    std::string key;   // verbatim, may be empty or end with '/'

    bool operator==(const BucketKey&) const = default;
};

[[nodiscard]] bool isS3Url(std::string_view address);

/// Splits "s3://bucket/key..." at the first '/' after the scheme.
/// "s3://" -> {"", ""}, "s3://b/" -> {"b", ""}, "s3://b/k/" -> {"b", "k/"}.
/// Throws std::invalid_argument when the scheme prefix is missing.
[[nodiscard]] BucketKey bucketKeyFromS3Path(const std::string& s3Path);

[[nodiscard]] std::string toS3Path(const BucketKey& bk);

}
