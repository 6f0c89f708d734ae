// src/api/ExchangeError.h
#pragma once

#include <iosfwd>
#include <string>
#include <variant>

#include "core/domain/OrderTypes.h"
#include "core/domain/Types.h"

/*
* ExchangeError.h
* 거래소 도메인 오류를 종류별 구조체로 표현하고 하나의 variant로 묶는다.
* - 오류의 정체성은 타입(종류) + 구조화된 필드
* - 거래소 호환 {code, msg}는 경계에서만 만드는 표현 (errorCode / errorMessage)
*/

namespace api
{
	// StopLoss 외 주문 타입으로 접수 시도
	struct UnsupportedOrderType
	{
		std::string		symbol;
		core::OrderType	type{ core::OrderType::Market };
	};

	// 현재 캔들 시가 기준으로 이미 트리거 조건이 성립
	struct ImmediateTrigger
	{
		std::string		symbol;
		core::OrderSide	side{ core::OrderSide::BUY };
		core::Price		stop_price{ 0.0 };
		core::Price		open_price{ 0.0 };
	};

	// 예약 필요량이 free 잔고를 초과
	struct InsufficientBalance
	{
		std::string		symbol;
		core::OrderSide	side{ core::OrderSide::BUY };
		std::string		asset;				// 예약 대상 자산 (BUY: quote, SELL: base)
		core::Amount	required{ 0.0 };
		core::Amount	free{ 0.0 };
	};

	// kline / 주문 이력 조회 파라미터 오류
	struct InvalidQuery
	{
		std::string		field;
		std::string		reason;
	};

	// 주문 파라미터 오류 (수량/가격 <= 0, 세션 심볼 불일치 등)
	struct InvalidOrder
	{
		std::string		field;
		std::string		reason;
	};

	using ExchangeError = std::variant<
		UnsupportedOrderType,
		ImmediateTrigger,
		InsufficientBalance,
		InvalidQuery,
		InvalidOrder>;

	// 성공 값 또는 도메인 오류
	template <typename T>
	using ExchangeResult = std::variant<T, ExchangeError>;

	// 거래소 호환 에러 코드 (-1116, -2010, -1102, -1013)
	int errorCode(const ExchangeError& err) noexcept;

	// 거래소 호환 메시지 + 구조화 필드 요약
	std::string errorMessage(const ExchangeError& err);

	// 로그용 종류 이름 ("InsufficientBalance" 등)
	const char* errorKind(const ExchangeError& err) noexcept;

	std::ostream& operator<<(std::ostream& os, const ExchangeError& err);
}
