// core/domain/Types.h
#pragma once

#include <cstdint>

namespace core 
{
	// 고유 타입 정의
	using Price = double;		// 가격
	using Volume = double;		// 수량

	using Amount = double;		// Price * Quantity -> 거래 금액

	using OrderId = std::int64_t;		// 거래소 주문 번호 (세션 내 단조 증가)
	using TimestampMs = std::int64_t;	// epoch 밀리초
}
