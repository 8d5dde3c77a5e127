// include/signal_ngin/data/fallback_candle_provider.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "signal_ngin/data/candle_provider.hpp"

namespace signal_ngin {
namespace data {

/**
 * @brief Tries a list of providers in order and returns the first non-empty answer
 *
 * When every source fails the error of the last failing source is returned; when
 * they all answer with nothing an empty series is returned.
 */
class FallbackCandleProvider : public CandleProvider {
public:
    explicit FallbackCandleProvider(std::vector<std::shared_ptr<CandleProvider>> sources);

    Result<CandleSeries> fetch_candles(const std::string& asset, const std::string& interval,
                                       size_t limit) override;

private:
    std::vector<std::shared_ptr<CandleProvider>> sources_;
};

/**
 * @brief Synthesize candles from close-only history
 *
 * open = close = price, high = price * 1.005, low = price * 0.995. Used when the
 * only available source reports a single price per interval.
 *
 * @param timestamps Timestamps, oldest first
 * @param prices Prices matching the timestamps
 * @param volumes Volumes matching the timestamps, or empty for zero volume
 */
CandleSeries candles_from_closes(const std::vector<Timestamp>& timestamps,
                                 const std::vector<double>& prices,
                                 const std::vector<double>& volumes = {});

}  // namespace data
}  // namespace signal_ngin
