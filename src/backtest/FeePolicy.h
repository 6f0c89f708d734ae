#pragma once

#include <algorithm>

// quote 기준 수수료 계산
namespace backtest
{
	// 수수료 적용 여부
	// - Charged: Ledger 자체 매수/매도 (commission rate 적용)
	// - Waived: 거래소 스탑 체결 경로 (수수료 없이 트리거 가격 그대로 정산)
	enum class Commission
	{
		Charged,
		Waived
	};

	// "고정 비율" 수수료 정책
	//
	// - rate: 예) 0.001 (0.1%)
	// - notional: 체결 금액(quote 기준) = price * quantity
	// - fee = notional * rate
	// - BUY 총지출 = notional + fee
	// - SELL 순수입 = notional - fee
	class FeePolicy
	{
	public:
		using Rate = double;

		constexpr FeePolicy() noexcept = default;
		constexpr explicit FeePolicy(Rate rate) noexcept : rate_(rate) {}

		[[nodiscard]] constexpr Rate rate() const noexcept { return rate_; }

		// [0, 1) 범위만 유효
		[[nodiscard]] constexpr bool valid() const noexcept { return rate_ >= 0.0 && rate_ < 1.0; }

		[[nodiscard]] constexpr double fee(double notional, Commission mode) const noexcept
		{
			return mode == Commission::Waived ? 0.0 : notional * rate_;
		}

		[[nodiscard]] constexpr double buyTotalCost(double notional, Commission mode) const noexcept
		{
			return notional + fee(notional, mode);
		}

		// rate < 1 이면 음수가 될 수 없지만 계좌를 망가뜨리지 않게 0으로 막는다
		[[nodiscard]] constexpr double sellNetProceeds(double notional, Commission mode) const noexcept
		{
			return std::max(0.0, notional - fee(notional, mode));
		}

	private:
		Rate rate_{ 0.0 };
	};
}
