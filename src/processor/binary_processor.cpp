#include "shipyard/binary_processor.hpp"
#include "shipyard/upload_engine.hpp"

#include <thread>

#include <spdlog/spdlog.h>

namespace shipyard {

BinaryProcessor::BinaryProcessor(Registry& registry, HttpTransport& transport,
                                 ProcessorConfig config, std::vector<SignatureConfig> signatures,
                                 SigningKeyPairs key_pairs, ProgressObserver* observer)
    : registry_(registry),
      transport_(transport),
      config_(std::move(config)),
      signatures_(std::move(signatures)),
      key_pairs_(std::move(key_pairs)),
      observer_(observer),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

Result<Binary> BinaryProcessor::process(const Binary& binary,
                                        const std::vector<uint8_t>* content) {
    using R = Result<Binary>;

    switch (binary.state) {
        case BinaryState::Signed:
        case BinaryState::Destroyed:
            spdlog::debug("binary {} is {}, nothing to do", binary.prn,
                          binary_state_to_string(binary.state));
            return R::ok(binary);
        case BinaryState::Unknown:
            spdlog::warn("binary {} is in unrecognised state '{}', skipping", binary.prn,
                         binary.state_text);
            return R::ok(binary);
        default:
            break;
    }

    // Work from the registry's current view so an interrupted run resumes
    auto fetched = registry_.get_binary(binary.prn);
    if (fetched.isErr()) {
        return R::err(fetched.error().withContext("reading binary " + binary.prn));
    }
    if (!fetched.value()) {
        return R::err(Error(ErrorCode::NOT_FOUND, "binary " + binary.prn + " does not exist"));
    }
    Binary current = std::move(*fetched.value());

    switch (current.state) {
        case BinaryState::Uploadable: {
            if (!content) {
                return R::err(Error(ErrorCode::INVALID_INPUT,
                    "binary " + current.prn + " (" + current.target +
                    ") is uploadable but no content was provided"));
            }

            UploadEngine engine(registry_, transport_, config_.upload, observer_);
            auto uploaded = engine.upload(current, *content);
            if (uploaded.isErr()) {
                return R::err(uploaded.error());
            }

            auto hashable = transition(current, BinaryState::Hashable);
            if (hashable.isErr()) return hashable;
            auto hashing = transition(hashable.value(), BinaryState::Hashing);
            if (hashing.isErr()) return hashing;
            return continue_from_hashing(hashing.value());
        }
        case BinaryState::Hashable: {
            auto hashing = transition(current, BinaryState::Hashing);
            if (hashing.isErr()) return hashing;
            return continue_from_hashing(hashing.value());
        }
        case BinaryState::Hashing:
            return continue_from_hashing(current);
        case BinaryState::Signable:
            return sign(current);
        default:
            return R::ok(current);
    }
}

Result<Binary> BinaryProcessor::transition(const Binary& binary, BinaryState to) {
    if (!transition_allowed(binary.state, to)) {
        return Result<Binary>::err(Error(ErrorCode::INVALID_INPUT,
            std::string("binary ") + binary.prn + " cannot move from " +
            binary_state_to_string(binary.state) + " to " + binary_state_to_string(to)));
    }

    UpdateBinaryParams params;
    params.prn = binary.prn;
    params.state = to;
    auto updated = registry_.update_binary(params);
    if (updated.isErr()) {
        return Result<Binary>::err(updated.error().withContext(
            std::string("moving ") + binary.prn + " to " + binary_state_to_string(to)));
    }
    spdlog::debug("binary {} is now {}", binary.prn, binary_state_to_string(to));
    return updated;
}

Result<Binary> BinaryProcessor::continue_from_hashing(const Binary& binary) {
    if (signatures_.empty()) {
        spdlog::info("binary {} is {}; no signatures configured", binary.prn,
                     binary_state_to_string(binary.state));
        return Result<Binary>::ok(binary);
    }

    auto signable = wait_for_signable(binary);
    if (signable.isErr()) return signable;
    return sign(signable.value());
}

Result<Binary> BinaryProcessor::wait_for_signable(const Binary& binary) {
    if (binary.state == BinaryState::Signable) {
        return Result<Binary>::ok(binary);
    }

    std::string last_state = binary_state_to_string(binary.state);
    for (uint32_t attempt = 1; attempt <= config_.poll_attempts; ++attempt) {
        sleep_(config_.poll_interval);

        auto fetched = registry_.get_binary(binary.prn);
        if (fetched.isErr()) {
            return Result<Binary>::err(fetched.error().withContext(
                "waiting for " + binary.prn + " to become signable"));
        }
        if (!fetched.value()) {
            last_state = "missing";
            spdlog::debug("poll {}/{}: binary {} not found", attempt, config_.poll_attempts,
                          binary.prn);
            continue;
        }

        const Binary& current = *fetched.value();
        if (current.state == BinaryState::Signable) {
            return Result<Binary>::ok(current);
        }
        last_state = current.state_text.empty() ? binary_state_to_string(current.state)
                                                : current.state_text;
        spdlog::debug("poll {}/{}: binary {} is {}", attempt, config_.poll_attempts,
                      binary.prn, last_state);
    }

    return Result<Binary>::err(Error(ErrorCode::TIMEOUT,
        "binary " + binary.prn + " did not become signable after " +
        std::to_string(config_.poll_attempts) + " attempts (last state: " + last_state + ")"));
}

Result<Binary> BinaryProcessor::sign(const Binary& binary) {
    if (signatures_.empty()) {
        return Result<Binary>::ok(binary);
    }
    SignatureOrchestrator orchestrator(registry_, key_pairs_, config_.content_hash);
    return orchestrator.sign(binary, signatures_);
}

} // namespace shipyard
