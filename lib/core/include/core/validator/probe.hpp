#pragma once

#include "core/common.hpp"
#include "core/wire/messages.hpp"
#include <cstdint>
#include <vector>

namespace TaoMap::Core::Validator::Probe {

/// What an honest miner sends back: expand(nonce, declared_size).
[[nodiscard]] std::vector<Byte> expected_payload(const Hash& nonce, std::uint64_t size);

/// SHA-256 of expected_payload, without materializing it.
[[nodiscard]] Hash expected_digest(const Hash& nonce, std::uint64_t size);

/// Honest miner behavior, for ChunkServer::set_probe_responder.
[[nodiscard]] Wire::ProbeResponse respond(const Wire::ProbeRequest& req);

/**
 * @brief Content check of a probe response against the precomputed hash of
 * the expected payload.
 *
 * Wrong round, wrong length, a declared fingerprint that does not match the
 * payload, or a payload other than the expected one all fail.
 */
[[nodiscard]] bool verify_response(const Wire::ProbeRequest& req, const Hash& expected_digest,
    const Wire::ProbeResponse& response);

} // namespace TaoMap::Core::Validator::Probe
