// core/domain/OrderRequest.h
#pragma once

#include <string>
#include <optional>

#include "Types.h"
#include "OrderTypes.h"

namespace core
{
	/*
	* 전략(Strategy)이 거래소에 전달하는 "주문 의도" 객체
	* 거래소 create_order 파라미터와 1:1 대응
	*/
	struct OrderRequest
	{
		std::string		symbol;						// 거래쌍 (ex: "ADAUSDC")
		OrderSide		side{ OrderSide::BUY };		// BUY / SELL
		OrderType		type{ OrderType::StopLoss };

		Volume			quantity{ 0.0 };			// 주문 수량 (base 기준)
		Price			stop_price{ 0.0 };			// 트리거 가격

		// 동시 주문 구분용, 프로그램에서 부여
		std::optional<std::string> client_order_id;
	};
}
