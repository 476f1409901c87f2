#pragma once

#include "shipyard/chunk_planner.hpp"
#include "shipyard/config.hpp"
#include "shipyard/http.hpp"
#include "shipyard/progress.hpp"
#include "shipyard/registry.hpp"

#include <cstdint>
#include <vector>

namespace shipyard {

struct UploadStats {
    uint32_t parts_total = 0;
    uint32_t parts_skipped = 0;     // already valid in the registry
    uint32_t parts_uploaded = 0;
    uint64_t bytes_transferred = 0;
};

/**
 * Uploads binary content as independently verified parts.
 *
 * Parts already registered as valid are skipped, so a failed upload can
 * be resumed by calling upload() again. The remaining parts are spread
 * over at most config.concurrency worker threads, each registering the
 * part to obtain a pre-signed URL and then PUTting the bytes there.
 * The first failure stops further dispatch and is returned once all
 * workers have finished.
 */
class UploadEngine {
public:
    UploadEngine(Registry& registry, HttpTransport& transport, UploadConfig config,
                 ProgressObserver* observer = nullptr);

    Result<UploadStats> upload(const Binary& binary, const std::vector<uint8_t>& content);

private:
    Result<void> upload_part(const Binary& binary, const std::vector<uint8_t>& content,
                             const ChunkSpec& chunk);

    Registry& registry_;
    HttpTransport& transport_;
    UploadConfig config_;
    ProgressObserver* observer_;
};

} // namespace shipyard
