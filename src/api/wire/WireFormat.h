// src/api/wire/WireFormat.h
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "api/ExchangeError.h"
#include "api/KlineQuery.h"
#include "core/domain/Account.h"
#include "core/domain/Candle.h"
#include "core/domain/ExchangeInfo.h"
#include "core/domain/Order.h"
#include "core/domain/Ticker.h"

/*
* 거래소 응답 모양(JSON)으로의 변환 계층
* - 숫자는 10진 문자열, id는 정수, 시각은 epoch ms
* - 도메인 타입은 JSON을 모른다. 경계에서만 이 함수들을 쓴다.
*/

namespace api::wire
{
	// 고정소수점 최단 표현 ("50", "0.1", "0.00001")
	std::string formatDecimal(double value);

	nlohmann::json toJson(const core::Order& order);
	nlohmann::json toJson(const std::vector<core::Order>& orders);
	nlohmann::json toJson(const core::AccountSnapshot& account);
	nlohmann::json toJson(const core::Ticker& ticker);
	nlohmann::json toJson(const core::ExchangeInfo& info);

	// 에러 -> {"code": -2010, "msg": "..."}
	nlohmann::json toJson(const ExchangeError& err);

	// kline 1개 -> 12칸 배열 [openTime, "o", "h", "l", "c", "v", closeTime, "qv", trades, "tbb", "tbq", "0"]
	nlohmann::json klineToJson(const core::Candle& candle);
	nlohmann::json klinesToJson(const std::vector<core::Candle>& candles);

	/*
	* 요청 파라미터(JSON) -> KlineQuery
	* - symbol, interval: 비어 있지 않은 문자열 (필수)
	* - startTime, endTime: 정수 (없거나 null이면 미지정)
	* - limit: 정수 또는 정수 문자열, 키가 없으면 500, null이면 상한 없음
	* 타입이 맞지 않으면 InvalidQuery
	*/
	ExchangeResult<KlineQuery> parseKlineQuery(const nlohmann::json& params);
}
