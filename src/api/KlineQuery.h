// src/api/KlineQuery.h
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/domain/Types.h"

namespace api
{
	// 거래소 get_klines 기본 limit
	inline constexpr std::int64_t kDefaultKlineLimit = 500;

	/*
	* 전략이 거래소에 보내는 kline 조회 요청
	* - limit: 기본 500, nullopt면 상한 없음, <= 0이면 빈 결과
	* - start_time 유무로 조회 모드가 갈린다 (SimExchange::getKlines 참고)
	*/
	struct KlineQuery
	{
		std::string							symbol;
		std::string							timeframe;		// "1m", "1h" ...
		std::optional<core::TimestampMs>	start_time;
		std::optional<core::TimestampMs>	end_time;
		std::optional<std::int64_t>			limit{ kDefaultKlineLimit };
	};

	// 저장소 정렬 방향 (open_time 기준)
	enum class SortOrder
	{
		Ascending,
		Descending
	};

	/*
	* 저장소(IKlineStore)에 내려가는 조회 조건
	* - start/end는 open_time 기준 포함 범위
	* - limit 없으면 전체
	*/
	struct KlineSelect
	{
		std::string							symbol;
		std::string							timeframe;
		std::optional<core::TimestampMs>	start_time;
		std::optional<core::TimestampMs>	end_time;
		std::optional<std::int64_t>			limit;
		SortOrder							order{ SortOrder::Ascending };
	};
}
