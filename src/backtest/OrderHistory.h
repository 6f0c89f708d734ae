// src/backtest/OrderHistory.h
#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "core/domain/Order.h"

namespace backtest
{
	// 이력 정리 기준 시각: updated_at, 없으면 created_at (둘 다 <= 0이면 판단 불가)
	constexpr std::optional<core::TimestampMs> historyTimestamp(const core::Order& order) noexcept
	{
		if (order.updated_at > 0)
			return order.updated_at;
		if (order.created_at > 0)
			return order.created_at;
		return std::nullopt;
	}

	/*
	* 이력 시퀀스 정리 (head부터 제거)
	* 1) 개수 상한 초과분 제거
	* 2) anchor - window 보다 오래된 항목 제거, 첫 번째로 남길 항목에서 멈춤
	*    - 시각을 알 수 없는 항목을 만나도 멈춘다 (개수 상한으로만 제거됨)
	*
	* Seq: size/front/pop_front를 가진 순차 컨테이너 (deque, 링버퍼 등)
	*/
	template <typename Seq>
	void trimHistory(Seq& seq,
		std::optional<core::TimestampMs> anchor,
		std::size_t max_orders,
		core::TimestampMs window_ms)
	{
		while (seq.size() > max_orders)
			seq.pop_front();

		if (!anchor.has_value())
			return;

		const core::TimestampMs cutoff = *anchor - window_ms;
		while (!seq.empty())
		{
			const auto ts = historyTimestamp(seq.front());
			if (!ts.has_value() || *ts >= cutoff)
				break;
			seq.pop_front();
		}
	}

	/*
	 * OrderHistory
	 * - 체결된 주문 이력 저장소 (전체 + 심볼별 두 시퀀스)
	 *
	 * 설계 요구사항:
	 * 1) 오래된 순 -> 최신 순 (tail이 최신)
	 * 2) 삽입할 때마다 두 시퀀스 모두 개수/시간 창 기준으로 정리
	 * 3) 조회는 const 참조 (호출자가 내부를 바꿀 수 없음)
	 * 4) 잘못된 레코드(id <= 0, 미종결 상태, 빈 심볼)는 std::invalid_argument
	 *    - 정렬/페이지네이션이 id에 의존하므로 조용히 버리지 않는다
	 */
	class OrderHistory
	{
	public:
		using Sequence = std::deque<core::Order>;

		OrderHistory(std::size_t max_orders, core::TimestampMs window_ms);

		void record(const core::Order& order);

		// 전체 이력
		[[nodiscard]] const Sequence& all() const noexcept { return all_; }

		// 심볼별 이력 (없으면 빈 시퀀스)
		[[nodiscard]] const Sequence& bySymbol(std::string_view symbol) const;

		[[nodiscard]] std::size_t size() const noexcept { return all_.size(); }
		[[nodiscard]] std::size_t maxOrders() const noexcept { return max_orders_; }
		[[nodiscard]] core::TimestampMs windowMs() const noexcept { return window_ms_; }

	private:
		std::size_t max_orders_;
		core::TimestampMs window_ms_;

		Sequence all_;
		std::map<std::string, Sequence, std::less<>> by_symbol_;
	};
}
