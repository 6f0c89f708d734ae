#include "OrderHistory.h"

#include <stdexcept>

namespace backtest
{
	OrderHistory::OrderHistory(std::size_t max_orders, core::TimestampMs window_ms)
		: max_orders_(max_orders)
		, window_ms_(window_ms)
	{
		if (max_orders_ == 0)
			throw std::invalid_argument("OrderHistory: max_orders must be > 0");
		if (window_ms_ < 0)
			throw std::invalid_argument("OrderHistory: window_ms must be >= 0");
	}

	void OrderHistory::record(const core::Order& order)
	{
		if (order.id <= 0)
			throw std::invalid_argument("OrderHistory: invalid order id " + std::to_string(order.id));
		if (order.symbol.empty())
			throw std::invalid_argument("OrderHistory: order " + std::to_string(order.id) + " has no symbol");
		if (!core::isTerminal(order.status))
		{
			throw std::invalid_argument("OrderHistory: order " + std::to_string(order.id)
				+ " is not settled (" + core::to_string(order.status) + ")");
		}

		const auto anchor = historyTimestamp(order);

		all_.push_back(order);
		trimHistory(all_, anchor, max_orders_, window_ms_);

		// 심볼 시퀀스는 처음 체결 시 생성
		auto it = by_symbol_.find(order.symbol);
		if (it == by_symbol_.end())
			it = by_symbol_.emplace(order.symbol, Sequence{}).first;

		it->second.push_back(order);
		trimHistory(it->second, anchor, max_orders_, window_ms_);
	}

	const OrderHistory::Sequence& OrderHistory::bySymbol(std::string_view symbol) const
	{
		static const Sequence kEmpty{};

		auto it = by_symbol_.find(symbol);
		if (it == by_symbol_.end())
			return kEmpty;
		return it->second;
	}
}
