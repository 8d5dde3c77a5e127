// include/signal_ngin/data/candle_provider.hpp
#pragma once

#include <string>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace data {

/**
 * @brief Source of historical candles
 *
 * Implementations return candles in ascending timestamp order and may return fewer
 * than `limit` candles when the history is short. Retry and backoff belong to the
 * implementation; callers treat any error as "no data".
 */
class CandleProvider {
public:
    virtual ~CandleProvider() = default;

    /**
     * @brief Fetch the most recent candles of an asset
     * @param asset Asset identifier
     * @param interval Candle interval, e.g. "15m", "1h", "1d"
     * @param limit Maximum number of candles
     * @return Candles oldest first, or the error that prevented the fetch
     */
    virtual Result<CandleSeries> fetch_candles(const std::string& asset,
                                               const std::string& interval, size_t limit) = 0;
};

}  // namespace data
}  // namespace signal_ngin
