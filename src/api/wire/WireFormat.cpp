#include "WireFormat.h"

#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>

namespace api::wire
{
	using nlohmann::json;

	std::string formatDecimal(double value)
	{
		char buf[512];
		auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
		if (ec != std::errc{})
			return "0";
		return std::string(buf, ptr);
	}

	json toJson(const core::Order& order)
	{
		// 시장가(가상 과거 주문)는 평균 체결가, 스탑 주문은 "0"
		double price = 0.0;
		if (order.type == core::OrderType::Market && order.executed_qty > 0)
			price = order.cumulative_quote_qty / order.executed_qty;

		json j = {
			{ "symbol", order.symbol },
			{ "orderId", order.id },
			{ "price", formatDecimal(price) },
			{ "origQty", formatDecimal(order.quantity) },
			{ "executedQty", formatDecimal(order.executed_qty) },
			{ "cummulativeQuoteQty", formatDecimal(order.cumulative_quote_qty) },
			{ "status", core::to_string(order.status) },
			{ "timeInForce", "GTC" },
			{ "type", core::to_string(order.type) },
			{ "side", core::to_string(order.side) },
			{ "stopPrice", formatDecimal(order.stop_price) },
			{ "time", order.created_at },
			{ "updateTime", order.updated_at },
			{ "isWorking", order.status == core::OrderStatus::New },
		};

		// clientOrderId는 있을 때만
		if (order.client_order_id.has_value() && !order.client_order_id->empty())
			j["clientOrderId"] = *order.client_order_id;

		return j;
	}

	json toJson(const std::vector<core::Order>& orders)
	{
		json arr = json::array();
		for (const auto& o : orders)
			arr.push_back(toJson(o));
		return arr;
	}

	json toJson(const core::AccountSnapshot& account)
	{
		json balances = json::array();
		for (const auto& b : account.balances)
		{
			balances.push_back({
				{ "asset", b.asset },
				{ "free", formatDecimal(b.free) },
				{ "locked", formatDecimal(b.locked) },
			});
		}
		return json{ { "balances", std::move(balances) } };
	}

	json toJson(const core::Ticker& ticker)
	{
		return json{ { "symbol", ticker.symbol }, { "price", formatDecimal(ticker.price) } };
	}

	json toJson(const core::ExchangeInfo& info)
	{
		json symbols = json::array();
		for (const auto& r : info.symbols)
		{
			symbols.push_back({
				{ "symbol", r.symbol },
				{ "baseAssetPrecision", r.base_asset_precision },
				{ "quoteAssetPrecision", r.quote_asset_precision },
				{ "filters", json::array({
					{ { "filterType", "LOT_SIZE" }, { "stepSize", formatDecimal(r.step_size) } },
					{ { "filterType", "PRICE_FILTER" }, { "tickSize", formatDecimal(r.tick_size) } },
					{ { "filterType", "MIN_NOTIONAL" }, { "minNotional", formatDecimal(r.min_notional) } },
				}) },
			});
		}
		return json{ { "symbols", std::move(symbols) } };
	}

	json toJson(const ExchangeError& err)
	{
		return json{ { "code", errorCode(err) }, { "msg", errorMessage(err) } };
	}

	json klineToJson(const core::Candle& c)
	{
		return json::array({
			c.open_time,
			formatDecimal(c.open),
			formatDecimal(c.high),
			formatDecimal(c.low),
			formatDecimal(c.close),
			formatDecimal(c.volume),
			c.close_time,
			formatDecimal(c.quote_volume),
			c.trade_count,
			formatDecimal(c.taker_buy_base_volume),
			formatDecimal(c.taker_buy_quote_volume),
			"0",
		});
	}

	json klinesToJson(const std::vector<core::Candle>& candles)
	{
		json arr = json::array();
		for (const auto& c : candles)
			arr.push_back(klineToJson(c));
		return arr;
	}

	namespace
	{
		// 필수 문자열 파라미터
		std::optional<ExchangeError> readRequiredString(const json& params, const char* key, std::string& out)
		{
			auto it = params.find(key);
			if (it == params.end() || !it->is_string() || it->get_ref<const std::string&>().empty())
				return ExchangeError{ InvalidQuery{ key, std::string(key) + " is required and must be a string" } };

			out = it->get<std::string>();
			return std::nullopt;
		}

		// 선택 정수 파라미터 (null/미지정 -> nullopt)
		std::optional<ExchangeError> readOptionalInteger(const json& params, const char* key,
			std::optional<std::int64_t>& out)
		{
			auto it = params.find(key);
			if (it == params.end() || it->is_null())
			{
				out.reset();
				return std::nullopt;
			}
			if (!it->is_number_integer())
				return ExchangeError{ InvalidQuery{ key, std::string(key) + " must be an integer (ms)" } };

			out = it->get<std::int64_t>();
			return std::nullopt;
		}
	}

	ExchangeResult<KlineQuery> parseKlineQuery(const json& params)
	{
		if (!params.is_object())
			return ExchangeError{ InvalidQuery{ "params", "request parameters must be an object" } };

		KlineQuery q;
		if (auto err = readRequiredString(params, "symbol", q.symbol))
			return *err;
		if (auto err = readRequiredString(params, "interval", q.timeframe))
			return *err;
		if (auto err = readOptionalInteger(params, "startTime", q.start_time))
			return *err;
		if (auto err = readOptionalInteger(params, "endTime", q.end_time))
			return *err;

		// limit: 키 없음 -> 기본값 유지, null -> 상한 없음, 정수 문자열 허용
		if (auto it = params.find("limit"); it != params.end())
		{
			if (it->is_null())
			{
				q.limit.reset();
			}
			else if (it->is_number_integer())
			{
				q.limit = it->get<std::int64_t>();
			}
			else if (it->is_string())
			{
				const auto& s = it->get_ref<const std::string&>();
				std::int64_t v = 0;
				auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
				if (ec != std::errc{} || ptr != s.data() + s.size())
					return ExchangeError{ InvalidQuery{ "limit", "limit must be an integer" } };
				q.limit = v;
			}
			else
			{
				return ExchangeError{ InvalidQuery{ "limit", "limit must be an integer" } };
			}
		}

		return q;
	}
}
