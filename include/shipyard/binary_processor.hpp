#pragma once

#include "shipyard/config.hpp"
#include "shipyard/http.hpp"
#include "shipyard/progress.hpp"
#include "shipyard/registry.hpp"
#include "shipyard/signature_orchestrator.hpp"

#include <chrono>
#include <functional>
#include <utility>
#include <vector>

namespace shipyard {

/**
 * Drives a binary through its lifecycle.
 *
 *   uploadable: upload content, then hashable, then hashing
 *   hashable:   move to hashing
 *   hashing:    wait for the registry to report signable (when signing)
 *   signable:   apply signatures, then signed
 *   signed, destroyed, unknown: returned unchanged without registry calls
 *
 * Without signature configurations processing stops once the binary is
 * hashing. Every state update is checked against transition_allowed
 * before it is sent.
 */
class BinaryProcessor {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    BinaryProcessor(Registry& registry, HttpTransport& transport, ProcessorConfig config,
                    std::vector<SignatureConfig> signatures, SigningKeyPairs key_pairs = {},
                    ProgressObserver* observer = nullptr);

    // content may be null unless the binary still needs uploading
    Result<Binary> process(const Binary& binary, const std::vector<uint8_t>* content);

    // Replaces the sleep used between polls
    void set_sleep_function(SleepFn sleep) { sleep_ = std::move(sleep); }

private:
    Result<Binary> transition(const Binary& binary, BinaryState to);
    Result<Binary> continue_from_hashing(const Binary& binary);
    Result<Binary> wait_for_signable(const Binary& binary);
    Result<Binary> sign(const Binary& binary);

    Registry& registry_;
    HttpTransport& transport_;
    ProcessorConfig config_;
    std::vector<SignatureConfig> signatures_;
    SigningKeyPairs key_pairs_;
    ProgressObserver* observer_;
    SleepFn sleep_;
};

} // namespace shipyard
