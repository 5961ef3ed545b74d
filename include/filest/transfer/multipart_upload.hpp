#pragma once

#include "filest/core/result.hpp"
#include "filest/events/event_bus.hpp"
#include "filest/transfer/chunked_upload.hpp"
#include "filest/transfer/path_resolver.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace filest::transfer {

/**
 * @brief A file part of a single-shot upload; the bytes are borrowed
 */
struct IncomingFile {
    std::string filename;
    const std::uint8_t* data = nullptr;
    std::size_t size = 0;
};

/**
 * @brief Writes the files of one multipart request into a directory
 *
 * Every file goes through a `.upload_<id>.tmp` sibling which is synced and
 * renamed over the final name, so readers never see a partial file. Files
 * are stored in request order; the first failure stops the request, files
 * stored before it stay.
 */
class MultipartUploadService {
public:
    static constexpr const char* kDefaultFilename = "unknown";

    MultipartUploadService(const PathResolver& resolver, events::EventBus& bus);

    Result<std::vector<CompletedUpload>> store(const std::string& directory,
                                               const std::vector<IncomingFile>& files);

private:
    Result<CompletedUpload> store_one(const SandboxedPath& directory, const IncomingFile& file);

    const PathResolver& resolver_;
    events::EventBus& event_bus_;
};

} // namespace filest::transfer
