// tests/test_wire_format.cpp
//
// 거래소 응답 JSON 변환 테스트
// - 숫자는 10진 문자열, id는 정수, 시각은 epoch ms
// - kline 12칸 배열, 에러 {code, msg}
// - 요청 파라미터 파싱 (limit 기본값/null/문자열)

#include <iostream>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "test_utils.h"
#include "fixtures/MarketFixture.h"
#include "api/wire/WireFormat.h"

using nlohmann::json;
using namespace api::wire;

namespace test {

    void testFormatDecimal() {
        TEST_ASSERT_EQ(formatDecimal(50.0), "50");
        TEST_ASSERT_EQ(formatDecimal(0.1), "0.1");
        TEST_ASSERT_EQ(formatDecimal(0.0001), "0.0001");
        TEST_ASSERT_EQ(formatDecimal(0.0), "0");
        TEST_ASSERT_EQ(formatDecimal(12.5), "12.5");
    }

    void testOrderJson() {
        core::Order o;
        o.id = 7;
        o.symbol = "ADAUSDC";
        o.side = core::OrderSide::SELL;
        o.type = core::OrderType::StopLoss;
        o.quantity = 5.0;
        o.stop_price = 3.0;
        o.status = core::OrderStatus::New;
        o.created_at = kT0;
        o.updated_at = kT0;

        json j = toJson(o);
        TEST_ASSERT_EQ(j.at("orderId").get<std::int64_t>(), 7);
        TEST_ASSERT_EQ(j.at("symbol").get<std::string>(), "ADAUSDC");
        TEST_ASSERT_EQ(j.at("origQty").get<std::string>(), "5");
        TEST_ASSERT_EQ(j.at("stopPrice").get<std::string>(), "3");
        TEST_ASSERT_EQ(j.at("price").get<std::string>(), "0");
        TEST_ASSERT_EQ(j.at("status").get<std::string>(), "NEW");
        TEST_ASSERT_EQ(j.at("type").get<std::string>(), "STOP_LOSS");
        TEST_ASSERT_EQ(j.at("side").get<std::string>(), "SELL");
        TEST_ASSERT_EQ(j.at("time").get<std::int64_t>(), kT0);
        TEST_ASSERT(j.at("isWorking").get<bool>());
        TEST_ASSERT(!j.contains("clientOrderId"));

        o.client_order_id = "abc";
        o.status = core::OrderStatus::Filled;
        o.executed_qty = 5.0;
        o.cumulative_quote_qty = 15.0;
        j = toJson(o);
        TEST_ASSERT_EQ(j.at("clientOrderId").get<std::string>(), "abc");
        TEST_ASSERT_EQ(j.at("executedQty").get<std::string>(), "5");
        TEST_ASSERT_EQ(j.at("cummulativeQuoteQty").get<std::string>(), "15");
        TEST_ASSERT(!j.at("isWorking").get<bool>());
    }

    // 가상 과거 주문(시장가)은 평균 체결가를 price로
    void testMarketOrderShowsAveragePrice() {
        core::Order o;
        o.id = 3;
        o.symbol = "ADAUSDC";
        o.type = core::OrderType::Market;
        o.status = core::OrderStatus::Filled;
        o.quantity = 2.0;
        o.executed_qty = 2.0;
        o.cumulative_quote_qty = 9.0;

        TEST_ASSERT_EQ(toJson(o).at("price").get<std::string>(), "4.5");
    }

    void testKlineArray() {
        const auto c = makeCandle(kT0, 4.0, 4.5, 3.5, 4.2, 1000.0);
        const json row = klineToJson(c);

        TEST_ASSERT(row.is_array());
        TEST_ASSERT_EQ(row.size(), static_cast<std::size_t>(12));
        TEST_ASSERT_EQ(row[0].get<std::int64_t>(), kT0);
        TEST_ASSERT_EQ(row[1].get<std::string>(), "4");
        TEST_ASSERT_EQ(row[2].get<std::string>(), "4.5");
        TEST_ASSERT_EQ(row[3].get<std::string>(), "3.5");
        TEST_ASSERT_EQ(row[4].get<std::string>(), "4.2");
        TEST_ASSERT_EQ(row[5].get<std::string>(), "1000");
        TEST_ASSERT_EQ(row[6].get<std::int64_t>(), kT0 + kMinute - 1);
        TEST_ASSERT_EQ(row[8].get<std::int64_t>(), 100);
        TEST_ASSERT_EQ(row[11].get<std::string>(), "0");

        TEST_ASSERT_EQ(klinesToJson(threeCandles()).size(), static_cast<std::size_t>(3));
    }

    void testAccountTickerExchangeInfo() {
        core::AccountSnapshot acc;
        acc.balances.push_back(core::AssetBalance{ "ADA", 2.0, 1.0 });
        acc.balances.push_back(core::AssetBalance{ "USDC", 50.0, 50.0 });

        const json a = toJson(acc);
        TEST_ASSERT_EQ(a.at("balances").size(), static_cast<std::size_t>(2));
        TEST_ASSERT_EQ(a.at("balances")[0].at("asset").get<std::string>(), "ADA");
        TEST_ASSERT_EQ(a.at("balances")[1].at("locked").get<std::string>(), "50");

        const json t = toJson(core::Ticker{ "ADAUSDC", 4.2 });
        TEST_ASSERT_EQ(t.at("price").get<std::string>(), "4.2");

        core::ExchangeInfo info;
        info.symbols.push_back(core::SymbolRules{ "ADAUSDC", 8, 8, 0.1, 0.0001, 10.0 });
        const json e = toJson(info);
        const json& filters = e.at("symbols")[0].at("filters");
        TEST_ASSERT_EQ(filters.size(), static_cast<std::size_t>(3));
        TEST_ASSERT_EQ(filters[0].at("stepSize").get<std::string>(), "0.1");
        TEST_ASSERT_EQ(filters[1].at("tickSize").get<std::string>(), "0.0001");
        TEST_ASSERT_EQ(filters[2].at("minNotional").get<std::string>(), "10");
    }

    void testErrorJson() {
        const api::ExchangeError err = api::InsufficientBalance{ "ADAUSDC", core::OrderSide::BUY, "USDC", 1000.0, 100.0 };
        const json j = toJson(err);

        TEST_ASSERT_EQ(j.at("code").get<int>(), -2010);
        TEST_ASSERT(j.at("msg").get<std::string>().find("insufficient balance") != std::string::npos);
        TEST_ASSERT_EQ(std::string(api::errorKind(err)), "InsufficientBalance");
    }

    // ========== 요청 파싱 ==========

    void testParseKlineQueryDefaults() {
        const auto r = parseKlineQuery(json{ { "symbol", "ADAUSDC" }, { "interval", "1m" } });
        TEST_ASSERT(std::holds_alternative<api::KlineQuery>(r));

        const auto& q = std::get<api::KlineQuery>(r);
        TEST_ASSERT_EQ(q.symbol, "ADAUSDC");
        TEST_ASSERT_EQ(q.timeframe, "1m");
        TEST_ASSERT(!q.start_time.has_value());
        TEST_ASSERT(!q.end_time.has_value());
        TEST_ASSERT_EQ(q.limit.value_or(-1), api::kDefaultKlineLimit);
    }

    void testParseKlineQueryLimitForms() {
        json p = { { "symbol", "ADAUSDC" }, { "interval", "1m" }, { "startTime", kT0 }, { "limit", "25" } };
        auto r = parseKlineQuery(p);
        TEST_ASSERT(std::holds_alternative<api::KlineQuery>(r));
        TEST_ASSERT_EQ(std::get<api::KlineQuery>(r).limit.value_or(-1), 25);
        TEST_ASSERT_EQ(std::get<api::KlineQuery>(r).start_time.value_or(0), kT0);

        p["limit"] = nullptr;
        r = parseKlineQuery(p);
        TEST_ASSERT(!std::get<api::KlineQuery>(r).limit.has_value());

        p["limit"] = 0;
        r = parseKlineQuery(p);
        TEST_ASSERT_EQ(std::get<api::KlineQuery>(r).limit.value_or(-1), 0);
    }

    void testParseKlineQueryRejectsMalformed() {
        auto isInvalid = [](const json& p) {
            const auto r = parseKlineQuery(p);
            return std::holds_alternative<api::ExchangeError>(r)
                && std::holds_alternative<api::InvalidQuery>(std::get<api::ExchangeError>(r));
        };

        TEST_ASSERT(isInvalid(json{ { "interval", "1m" } }));
        TEST_ASSERT(isInvalid(json{ { "symbol", "" }, { "interval", "1m" } }));
        TEST_ASSERT(isInvalid(json{ { "symbol", "ADAUSDC" } }));
        TEST_ASSERT(isInvalid(json{ { "symbol", "ADAUSDC" }, { "interval", "1m" }, { "startTime", "yesterday" } }));
        TEST_ASSERT(isInvalid(json{ { "symbol", "ADAUSDC" }, { "interval", "1m" }, { "endTime", 1.5 } }));
        TEST_ASSERT(isInvalid(json{ { "symbol", "ADAUSDC" }, { "interval", "1m" }, { "limit", "ten" } }));
        TEST_ASSERT(isInvalid(json{ { "symbol", "ADAUSDC" }, { "interval", "1m" }, { "limit", 2.5 } }));
        TEST_ASSERT(isInvalid(json::array()));
    }

    bool runAllTests() {
        static const TestCase tests[] = {
            {"FormatDecimal", testFormatDecimal},
            {"OrderJson", testOrderJson},
            {"MarketOrderShowsAveragePrice", testMarketOrderShowsAveragePrice},
            {"KlineArray", testKlineArray},
            {"AccountTickerExchangeInfo", testAccountTickerExchangeInfo},
            {"ErrorJson", testErrorJson},
            {"ParseKlineQueryDefaults", testParseKlineQueryDefaults},
            {"ParseKlineQueryLimitForms", testParseKlineQueryLimitForms},
            {"ParseKlineQueryRejectsMalformed", testParseKlineQueryRejectsMalformed},
        };
        return runSuite("Wire Format Tests", tests);
    }

} // namespace test

int main() {
    return test::runAllTests() ? 0 : 1;
}
