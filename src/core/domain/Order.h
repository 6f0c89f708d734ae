// core/domain/Order.h
#pragma once

#include <string>
#include <optional>

#include "OrderTypes.h"
#include "Types.h"

namespace core 
{

	/*
	* 거래소가 관리하는 주문 레코드
	* - 접수 시 New, 이후 정확히 한 번 Filled 또는 Canceled로 전환
	* - 부분 체결 없음: executed_qty는 0 또는 quantity
	*/

	struct Order 
	{
		OrderId					id{ 0 };				// 거래소 주문 번호
		std::optional<std::string> client_order_id;	// 클라이언트 주문 ID (있을 경우)
		std::string				symbol;					// 거래쌍 (예: "ADAUSDC")
		OrderSide				side{ OrderSide::BUY };	// 매수/매도 구분
		OrderType				type{ OrderType::StopLoss };
		Volume					quantity{ 0.0 };		// 주문 수량
		Price					stop_price{ 0.0 };		// 트리거 가격
		OrderStatus				status{ OrderStatus::New };

		Volume					executed_qty{ 0.0 };			// 체결 수량
		Amount					cumulative_quote_qty{ 0.0 };	// 체결 금액 (quote 기준)

		TimestampMs				created_at{ 0 };		// 접수 시각 (커서 캔들 기준)
		TimestampMs				updated_at{ 0 };		// 마지막 상태 전환 시각
	};

}
