#include "core/validator/selection.hpp"
#include "crypto/random.hpp"
#include "crypto/sha256.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <charconv>
#include <set>
#include <string>
#include <system_error>
#include <utility>

namespace TaoMap::Core::Validator::Selection {

namespace {

    template <typename T>
    void shuffle_prefix(std::vector<T>& items, size_t k, Crypto::Random::SeededStream& stream)
    {
        // partial Fisher-Yates: positions [0, k) end up a uniform k-subset
        const size_t n = items.size();
        for (size_t i = 0; i < k && i + 1 < n; ++i) {
            size_t j = i + static_cast<size_t>(stream.uniform(n - i));
            std::swap(items[i], items[j]);
        }
    }

    Hash domain_seed(const SamplingSeed& seed, std::string_view domain, RoundId round)
    {
        auto digest = Crypto::Sha256()
                          .update(Crypto::as_span(domain))
                          .update(BytesSpan { seed })
                          .update_u64(round)
                          .finish();
        if (!digest) {
            throw std::system_error(digest.error());
        }
        return *digest;
    }

} // namespace

auto draw_seed() -> std::expected<SamplingSeed, std::error_code>
{
    return Crypto::Random::hash();
}

SeedCommitment commit(const SamplingSeed& seed)
{
    return SeedCommitment { .digest = Crypto::Utils::sha256(seed) };
}

bool verify_reveal(const SeedCommitment& commitment, const SamplingSeed& seed)
{
    return commit(seed) == commitment;
}

std::vector<MinerCapability> select_sample(std::span<const MinerCapability> miners, size_t k,
    const SamplingSeed& seed, RoundId round)
{
    std::vector<MinerCapability> pool(miners.begin(), miners.end());
    k = std::min(k, pool.size());

    Crypto::Random::SeededStream stream(domain_seed(seed, "select", round), "select");
    shuffle_prefix(pool, k, stream);
    pool.resize(k);
    return pool;
}

Hash probe_nonce(const SamplingSeed& seed, RoundId round, MinerId miner)
{
    auto digest = Crypto::Sha256()
                      .update(Crypto::as_span("nonce"))
                      .update(BytesSpan { seed })
                      .update_u64(round)
                      .update_u32(static_cast<std::uint32_t>(miner))
                      .finish();
    if (!digest) {
        throw std::system_error(digest.error());
    }
    return *digest;
}

std::optional<std::uint32_t> parse_ipv4(std::string_view host)
{
    std::uint32_t value = 0;
    const char* p = host.data();
    const char* end = host.data() + host.size();
    for (int i = 0; i < 4; ++i) {
        if (i > 0) {
            if (p == end || *p != '.')
                return std::nullopt;
            ++p;
        }
        unsigned octet = 0;
        auto [next, ec] = std::from_chars(p, end, octet);
        if (ec != std::errc {} || next == p || octet > 255)
            return std::nullopt;
        value = (value << 8) | octet;
        p = next;
    }
    if (p != end)
        return std::nullopt;
    return value;
}

std::vector<std::vector<MinerCapability>> group_by_address(std::span<const MinerCapability> miners,
    size_t group_size, const SamplingSeed& seed)
{
    std::vector<std::vector<MinerCapability>> groups;
    if (group_size == 0) {
        return groups;
    }

    std::vector<MinerCapability> unique;
    std::set<std::string> hosts;
    for (const auto& m : miners) {
        if (m.endpoint.host.empty() || m.endpoint.host == "0.0.0.0") {
            continue;
        }
        if (hosts.insert(m.endpoint.host).second) {
            unique.push_back(m);
        } else {
            BOOST_LOG_TRIVIAL(debug) << "miner " << m.id << " shares host " << m.endpoint.host << ", skipped";
        }
    }

    // IPv4 按数值排序，其它地址排在后面按字典序
    std::ranges::stable_sort(unique, [](const MinerCapability& a, const MinerCapability& b) {
        auto ia = parse_ipv4(a.endpoint.host);
        auto ib = parse_ipv4(b.endpoint.host);
        if (ia && ib)
            return *ia < *ib;
        if (ia || ib)
            return ia.has_value();
        return a.endpoint.host < b.endpoint.host;
    });

    for (size_t i = 0; i < unique.size(); i += group_size) {
        auto last = std::min(unique.size(), i + group_size);
        groups.emplace_back(unique.begin() + static_cast<std::ptrdiff_t>(i), unique.begin() + static_cast<std::ptrdiff_t>(last));
    }

    Crypto::Random::SeededStream stream(seed, "groups");
    shuffle_prefix(groups, groups.size(), stream);
    return groups;
}

} // namespace TaoMap::Core::Validator::Selection
