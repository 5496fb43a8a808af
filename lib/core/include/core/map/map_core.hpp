#pragma once

#include "core/common.hpp"
#include "core/map/assignment.hpp"
#include "core/transfer/record.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <system_error>
#include <vector>

namespace TaoMap::Core::Map {

enum class IndexState : std::uint8_t {
    Pending,
    Delivered,
    Failed,
};

struct MapRoundResult {
    RoundStatus status = RoundStatus::Healthy;
    std::vector<std::uint32_t> delivered;
    std::vector<std::uint32_t> failed;
    std::map<std::uint32_t, MinerId> winners; ///< index -> miner whose ack won
    std::vector<TransferRecord> records;
};

/**
 * @brief Pure per-round state of the map phase: no IO, no clock.
 *
 * The driver reports every send outcome here and asks whom to retry. The
 * first ack per index wins; anything after it is discarded.
 */
class MapCore {
public:
    MapCore(const Assignment& assignment, std::uint32_t max_retries);

    void mark_sending(std::uint32_t index, MinerId to);

    /// true when this ack is the first one for the index
    bool observe_ack(std::uint32_t index, MinerId from);

    void observe_failure(std::uint32_t index, MinerId from, const std::error_code& ec);

    /**
     * Picks a different holder of @p index to retry after @p failed gave up,
     * consuming one unit of the index's retry budget. Candidates are holders
     * that are not excluded, not currently sending, and have not failed this
     * index with a non-retryable error.
     */
    std::optional<MinerId> next_retry_target(std::uint32_t index, MinerId failed);

    [[nodiscard]] IndexState state(std::uint32_t index) const { return states_.at(index); }
    [[nodiscard]] bool is_excluded(MinerId miner) const { return excluded_.contains(miner); }
    [[nodiscard]] std::uint32_t retries_used(std::uint32_t index) const { return retries_.at(index); }
    [[nodiscard]] std::optional<MinerId> winner(std::uint32_t index) const;

    /// Every index is Delivered, or has nobody left sending it.
    [[nodiscard]] bool all_settled() const;

    /// Marks every non-delivered index Failed and builds the result.
    MapRoundResult finalize();

private:
    const Assignment& assignment_;
    std::uint32_t max_retries_;

    std::vector<IndexState> states_;
    std::vector<std::uint32_t> retries_;
    std::vector<std::set<MinerId>> inflight_;
    // 在该 index 上以不可重试的错误失败过的 miner
    std::vector<std::set<MinerId>> dead_;
    std::map<std::uint32_t, MinerId> winners_;
    std::set<MinerId> excluded_;
};

} // namespace TaoMap::Core::Map
