// src/backtest/MarketSeries.h
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/domain/Candle.h"
#include "core/domain/Types.h"

namespace backtest
{
	/*
	* MarketCursor
	* - 시계열 안에서 "지금"을 가리키는 위치
	* - 위치(index)와 그 캔들의 시각(open_time)을 함께 들고 다닌다
	* - MarketSeries만 만들 수 있으므로 항상 유효한 위치
	*/
	struct MarketCursor
	{
		std::size_t			index{ 0 };
		core::TimestampMs	open_time{ 0 };
	};

	/*
	* MarketSeries
	* 한 심볼/타임프레임의 OHLCV 시계열 (불변)
	*
	* [불변 조건]
	* - 비어 있지 않음
	* - open_time 엄격한 오름차순 (중복 없음)
	* 위반 시 생성자에서 std::invalid_argument
	*/
	class MarketSeries
	{
	public:
		MarketSeries(std::string symbol, std::string timeframe, std::vector<core::Candle> candles);

		const std::string& symbol() const noexcept { return symbol_; }
		const std::string& timeframe() const noexcept { return timeframe_; }

		std::size_t size() const noexcept { return candles_.size(); }
		const std::vector<core::Candle>& candles() const noexcept { return candles_; }

		// index 범위 밖이면 std::out_of_range
		const core::Candle& at(std::size_t index) const;
		const core::Candle& at(const MarketCursor& cursor) const { return candles_[cursor.index]; }

		// index 위치 커서 (범위 밖 std::out_of_range)
		MarketCursor cursorAt(std::size_t index) const;

		// open_time이 정확히 일치하는 캔들 위치 (없으면 nullopt)
		std::optional<MarketCursor> findCursor(core::TimestampMs open_time) const;

		const core::Candle& front() const noexcept { return candles_.front(); }
		const core::Candle& back() const noexcept { return candles_.back(); }

	private:
		std::string symbol_;
		std::string timeframe_;
		std::vector<core::Candle> candles_;
	};
}
