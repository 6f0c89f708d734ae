#include "MarketSeries.h"

#include <algorithm>
#include <stdexcept>

namespace backtest
{
	MarketSeries::MarketSeries(std::string symbol, std::string timeframe, std::vector<core::Candle> candles)
		: symbol_(std::move(symbol))
		, timeframe_(std::move(timeframe))
		, candles_(std::move(candles))
	{
		if (symbol_.empty())
			throw std::invalid_argument("MarketSeries: symbol must not be empty");
		if (candles_.empty())
			throw std::invalid_argument("MarketSeries: no candles for " + symbol_);

		// 정렬/중복 검사: 커서 탐색(이진 탐색)과 시간 창 계산이 이 순서에 의존
		for (std::size_t i = 1; i < candles_.size(); ++i)
		{
			if (candles_[i].open_time <= candles_[i - 1].open_time)
			{
				throw std::invalid_argument("MarketSeries: open_time not strictly ascending at index "
					+ std::to_string(i) + " for " + symbol_);
			}
		}
	}

	const core::Candle& MarketSeries::at(std::size_t index) const
	{
		return candles_.at(index);
	}

	MarketCursor MarketSeries::cursorAt(std::size_t index) const
	{
		if (index >= candles_.size())
		{
			throw std::out_of_range("MarketSeries: cursor index " + std::to_string(index)
				+ " out of range (size " + std::to_string(candles_.size()) + ")");
		}
		return MarketCursor{ index, candles_[index].open_time };
	}

	std::optional<MarketCursor> MarketSeries::findCursor(core::TimestampMs open_time) const
	{
		auto it = std::lower_bound(candles_.begin(), candles_.end(), open_time,
			[](const core::Candle& c, core::TimestampMs t) { return c.open_time < t; });

		if (it == candles_.end() || it->open_time != open_time)
			return std::nullopt;

		const auto index = static_cast<std::size_t>(std::distance(candles_.begin(), it));
		return MarketCursor{ index, open_time };
	}
}
