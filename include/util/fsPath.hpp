#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sk::util {

// Joins two address segments with exactly one '/' at the seam. Either side may be
// empty, in which case the other is returned untouched.
inline std::string joinPath(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.empty()) return std::string(rhs);
    if (rhs.empty()) return std::string(lhs);

    const auto left = lhs.ends_with('/') ? lhs.substr(0, lhs.size() - 1) : lhs;
    const auto right = rhs.starts_with('/') ? rhs.substr(1) : rhs;

    std::string out;
    out.reserve(left.size() + right.size() + 1);
    out.append(left).append("/").append(right);
    return out;
}

inline std::string joinPath(const std::string_view first, const std::string_view second, const std::string_view third) {
    return joinPath(joinPath(first, second), third);
}

// Removes a leading prefix, throwing if the path does not start with it.
inline std::string stripPrefix(const std::string_view path, const std::string_view prefix) {
    if (!path.starts_with(prefix))
        throw std::invalid_argument("Path '" + std::string(path) + "' does not start with prefix '" +
                                    std::string(prefix) + "'");
    return std::string(path.substr(prefix.size()));
}

// "s3://bucket/a/b", "s3://", "/mnt" -> "/mnt/bucket/a/b"
inline std::string replacePrefix(const std::string_view path,
                                 const std::string_view cutPrefix,
                                 const std::string_view replacement) {
    return joinPath(replacement, stripPrefix(path, cutPrefix));
}

}
