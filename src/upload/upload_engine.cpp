#include "shipyard/upload_engine.hpp"
#include "shipyard/hashing.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <set>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

namespace shipyard {

UploadEngine::UploadEngine(Registry& registry, HttpTransport& transport, UploadConfig config,
                           ProgressObserver* observer)
    : registry_(registry), transport_(transport), config_(config), observer_(observer) {}

Result<UploadStats> UploadEngine::upload(const Binary& binary,
                                         const std::vector<uint8_t>& content) {
    using R = Result<UploadStats>;

    auto valid = validate_upload_config(config_);
    if (valid.isErr()) {
        return R::err(valid.error());
    }

    auto plan = plan_chunks(content.size(), config_.part_size);
    if (plan.isErr()) {
        return R::err(plan.error().withContext("binary " + binary.prn));
    }
    const auto& chunks = plan.value();

    auto existing = registry_.list_binary_parts(binary.prn);
    if (existing.isErr()) {
        return R::err(existing.error().withContext("listing parts of " + binary.prn));
    }

    std::set<uint32_t> valid_indexes;
    for (const auto& part : existing.value()) {
        if (part.state == BinaryPartState::Valid) {
            valid_indexes.insert(part.index);
        }
    }

    UploadStats stats;
    stats.parts_total = static_cast<uint32_t>(chunks.size());

    ProgressCounter progress(observer_, content.size());
    if (observer_) observer_->on_start(binary.prn, content.size());

    std::vector<ChunkSpec> pending;
    for (const auto& chunk : chunks) {
        if (valid_indexes.count(chunk.index)) {
            ++stats.parts_skipped;
            progress.add(chunk.size);
        } else {
            pending.push_back(chunk);
        }
    }

    spdlog::debug("binary {}: {} parts, {} already valid", binary.prn,
                  stats.parts_total, stats.parts_skipped);

    std::atomic<size_t> cursor{0};
    std::atomic<bool> failed{false};
    std::atomic<uint32_t> uploaded{0};
    std::atomic<uint64_t> transferred{0};
    std::mutex error_mutex;
    std::optional<Error> first_error;

    auto worker = [&]() {
        while (!failed.load()) {
            size_t i = cursor.fetch_add(1);
            if (i >= pending.size()) return;

            const ChunkSpec& chunk = pending[i];
            auto result = upload_part(binary, content, chunk);
            if (result.isErr()) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = result.error();
                }
                failed.store(true);
                return;
            }

            uploaded.fetch_add(1);
            transferred.fetch_add(chunk.size);
            progress.add(chunk.size);
        }
    };

    size_t thread_count = std::min<size_t>(config_.concurrency, pending.size());
    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (size_t t = 0; t < thread_count; ++t) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error& e) {
            // Workers already running must still be joined
            spdlog::warn("started {} of {} upload workers for {}: {}", workers.size(),
                         thread_count, binary.prn, e.what());
            break;
        }
    }
    if (workers.empty()) {
        worker();
    }
    for (auto& thread : workers) {
        thread.join();
    }

    if (observer_) observer_->on_finish(!first_error.has_value());

    if (first_error) {
        return R::err(*first_error);
    }

    stats.parts_uploaded = uploaded.load();
    stats.bytes_transferred = transferred.load();
    spdlog::info("uploaded {} of {} parts for {} ({} bytes)", stats.parts_uploaded,
                 stats.parts_total, binary.prn, stats.bytes_transferred);
    return R::ok(stats);
}

Result<void> UploadEngine::upload_part(const Binary& binary, const std::vector<uint8_t>& content,
                                       const ChunkSpec& chunk) {
    std::string where = "part " + std::to_string(chunk.index) + " of " + binary.prn;

    const uint8_t* data = content.data() + chunk.offset;
    auto hash = compute_sha256(data, static_cast<size_t>(chunk.size));
    if (!hash.ok) {
        return Result<void>::err(Error(ErrorCode::TRANSFER_FAILED, where + ": " + hash.error));
    }

    CreateBinaryPartParams params;
    params.binary_prn = binary.prn;
    params.index = chunk.index;
    params.size = chunk.size;
    params.hash = hash.hex_digest;
    params.expected_binary_size = content.size();

    auto part = registry_.create_binary_part(params);
    if (part.isErr()) {
        return Result<void>::err(part.error().withContext(where));
    }
    if (part.value().presigned_upload_url.empty()) {
        return Result<void>::err(Error(ErrorCode::REGISTRY_ERROR,
            where + ": registry returned no upload URL"));
    }

    HttpRequest request;
    request.method = "PUT";
    request.url = part.value().presigned_upload_url;
    request.headers["x-amz-checksum-sha256"] = base64_encode(hash.digest);
    request.headers["content-length"] = std::to_string(chunk.size);
    request.headers["content-type"] = "application/octet-stream";
    request.body.assign(data, data + chunk.size);

    HttpResponse response = transport_.perform(request);
    if (!response.ok) {
        return Result<void>::err(Error(ErrorCode::TRANSFER_FAILED, where + ": " + response.error));
    }
    if (!response.success()) {
        return Result<void>::err(Error(ErrorCode::TRANSFER_FAILED,
            where + ": storage returned HTTP " + std::to_string(response.status)));
    }

    spdlog::debug("uploaded {} ({} bytes)", where, chunk.size);
    return Result<void>::ok();
}

} // namespace shipyard
