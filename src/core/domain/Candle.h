// core/domain/Candle.h
#pragma once

#include <cstdint>

#include "Types.h"

namespace core {

    /*
	* 캔들(봉) 한 개
	* - 저장소 kline 행의 11개 컬럼을 그대로 담는다 (값 변환 없음)
    */

    struct Candle {
		TimestampMs open_time{ 0 };		// 시작 시각 (ms)

		Price  open{ 0.0 };				// 시가
		Price  high{ 0.0 };				// 고가
		Price  low{ 0.0 };				// 저가
		Price  close{ 0.0 };			// 종가
		Volume volume{ 0.0 };			// 거래량 (base)

		TimestampMs close_time{ 0 };	// 종료 시각 (ms)

		Amount quote_volume{ 0.0 };				// 거래대금 (quote)
		std::int64_t trade_count{ 0 };			// 체결 건수
		Volume taker_buy_base_volume{ 0.0 };	// 테이커 매수 거래량 (base)
		Amount taker_buy_quote_volume{ 0.0 };	// 테이커 매수 거래대금 (quote)
    };

} // namespace core
