#include "storage/FileSystemDataStorage.hpp"
#include "log/Registry.hpp"

#include <system_error>

using namespace sk::storage;

namespace fs = std::filesystem;

fs::path FileSystemDataStorage::fetchFile(const std::string& inputPath, const fs::path& localPrefix) const {
    const fs::path src(inputPath);

    if (!fs::is_regular_file(src)) {
        log::Registry::storage()->error("[FileSystemDataStorage] Source file does not exist: {}", inputPath);
        throw fs::filesystem_error("Source file does not exist", src,
                                   std::make_error_code(std::errc::no_such_file_or_directory));
    }

    fs::create_directories(localPrefix);

    const auto dst = localPrefix / src.filename();
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing);

    log::Registry::storage()->debug("[FileSystemDataStorage] Copied {} -> {}", src.string(), dst.string());
    return dst;
}
