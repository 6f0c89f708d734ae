// core/domain/OrderTypes.h
#pragma once

#include <optional>
#include <string_view>

// 주문 방향/타입/상태 등에 대한 Enum 정의
namespace core 
{

	// 주문 시 사용하는 매수/매도 구분 Enum
	enum class OrderSide 
	{
		BUY,
		SELL
	};

	// 주문 타입 Enum
	// - 백테스트 거래소는 StopLoss만 접수한다
	// - Market/Limit은 거부 사유 표현과 가상 과거 주문에만 쓰인다
	enum class OrderType 
	{
		Market,		// 시장가
		Limit,		// 지정가
		StopLoss	// 스탑 트리거 (트리거 가격에 전량 체결)
	};

	enum class OrderStatus 
	{
		New,		// 접수됨 (예약 보유 중)
		Filled,		// 주문 체결됨
		Canceled	// 주문 취소됨
	};

	// 로그/와이어 표현용 문자열 (거래소 표기와 동일)
	inline const char* to_string(OrderSide s) noexcept {
		switch (s) {
		case OrderSide::BUY:	return "BUY";
		case OrderSide::SELL:	return "SELL";
		default:				return "UNKNOWN";
		}
	}

	inline const char* to_string(OrderType t) noexcept {
		switch (t) {
		case OrderType::Market:		return "MARKET";
		case OrderType::Limit:		return "LIMIT";
		case OrderType::StopLoss:	return "STOP_LOSS";
		default:					return "UNKNOWN";
		}
	}

	inline const char* to_string(OrderStatus s) noexcept {
		switch (s) {
		case OrderStatus::New:			return "NEW";
		case OrderStatus::Filled:		return "FILLED";
		case OrderStatus::Canceled:		return "CANCELED";
		default:						return "UNKNOWN";
		}
	}

	// 와이어 문자열 -> enum (대소문자 구분, 모르는 값은 nullopt)
	inline std::optional<OrderSide> parseOrderSide(std::string_view s) noexcept {
		if (s == "BUY") return OrderSide::BUY;
		if (s == "SELL") return OrderSide::SELL;
		return std::nullopt;
	}

	inline std::optional<OrderType> parseOrderType(std::string_view s) noexcept {
		if (s == "MARKET") return OrderType::Market;
		if (s == "LIMIT") return OrderType::Limit;
		if (s == "STOP_LOSS") return OrderType::StopLoss;
		return std::nullopt;
	}

	// 종결 상태 여부 (Filled/Canceled는 이후 변경 불가)
	constexpr bool isTerminal(OrderStatus s) noexcept
	{
		return s == OrderStatus::Filled || s == OrderStatus::Canceled;
	}

}
