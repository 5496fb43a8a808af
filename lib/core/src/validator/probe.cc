#include "core/validator/probe.hpp"
#include "crypto/random.hpp"

namespace TaoMap::Core::Validator::Probe {

std::vector<Byte> expected_payload(const Hash& nonce, std::uint64_t size)
{
    return Crypto::Random::expand(nonce, static_cast<size_t>(size));
}

Hash expected_digest(const Hash& nonce, std::uint64_t size)
{
    return Crypto::Random::expand_digest(nonce, static_cast<size_t>(size));
}

Wire::ProbeResponse respond(const Wire::ProbeRequest& req)
{
    Wire::ProbeResponse response { .round_id = req.round_id, .fingerprint = {}, .payload = expected_payload(req.nonce, req.declared_size) };
    response.fingerprint = Crypto::Utils::sha256(response.payload);
    return response;
}

bool verify_response(const Wire::ProbeRequest& req, const Hash& expected_digest, const Wire::ProbeResponse& response)
{
    if (response.round_id != req.round_id || response.payload.size() != req.declared_size) {
        return false;
    }
    auto actual = Crypto::Utils::sha256(response.payload);
    return actual == response.fingerprint && actual == expected_digest;
}

} // namespace TaoMap::Core::Validator::Probe
