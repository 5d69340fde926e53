#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sk::storage::s3 {

// Raised for every failed transport call. code() carries the service error code
// ("NoSuchKey", "AccessDenied", "404" for body-less responses) or "RequestError"
// when no HTTP response was received.
class ClientError : public std::runtime_error {
public:
    static constexpr const char* REQUEST_ERROR = "RequestError";

    ClientError(std::string code, long httpStatus, const std::string& message);

    [[nodiscard]] const std::string& code() const noexcept { return code_; }
    [[nodiscard]] long httpStatus() const noexcept { return httpStatus_; }
    [[nodiscard]] bool notFound() const noexcept;

private:
    std::string code_;
    long httpStatus_;
};

// Inclusive byte range as used by the HTTP Range header
struct ByteRange {
    uint64_t first;
    uint64_t last;
};

class Client {
public:
    virtual ~Client() = default;

    // Metadata-only probe; throws ClientError (notFound() for a missing key).
    virtual void headObject(const std::string& bucket, const std::string& key) const = 0;

    virtual void putObject(const std::string& bucket, const std::string& key,
                           const std::vector<uint8_t>& body) const = 0;

    virtual void uploadFile(const std::filesystem::path& filename,
                            const std::string& bucket, const std::string& key) const = 0;

    virtual void downloadFile(const std::string& bucket, const std::string& key,
                              const std::filesystem::path& filename) const = 0;

    [[nodiscard]] virtual std::vector<uint8_t> getObject(const std::string& bucket, const std::string& key,
                                                         const std::optional<ByteRange>& range = std::nullopt) const = 0;
};

}
