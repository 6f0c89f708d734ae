// tests/test_config.cpp
//
// 설정 로드 테스트
// - 누락 키 기본값 유지, 섹션별 덮어쓰기
// - 파일 없음/파싱 실패/타입 불일치/0 값은 std::runtime_error
// - 로그 레벨 문자열 검증

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "test_utils.h"
#include "util/Config.h"
#include "util/Logger.h"

namespace test {

    std::string writeTempConfig(const char* name, const std::string& body) {
        const auto path = std::filesystem::temp_directory_path() / (std::string("coinsim_cfg_") + name + ".json");
        std::ofstream out(path);
        out << body;
        return path.string();
    }

    void testDefaults() {
        const util::AppConfig cfg;
        TEST_ASSERT_EQ(cfg.backtest.symbol, "ADAUSDC");
        TEST_ASSERT_EQ(cfg.backtest.timeframe, "1m");
        TEST_ASSERT_EQ(cfg.history.max_orders, static_cast<std::size_t>(100));
        TEST_ASSERT_EQ(cfg.history.window_ms, 86'400'000LL);
        TEST_ASSERT_EQ(cfg.synthetic.max_orders, static_cast<std::size_t>(50));
        TEST_ASSERT_EQ(cfg.synthetic.series_divisor, static_cast<std::size_t>(10));
        TEST_ASSERT_DOUBLE_EQ(cfg.rules.step_size, 0.1);
        TEST_ASSERT(cfg.backtest.balance_epsilon == 1e-9);
        TEST_ASSERT_EQ(cfg.symbols.at("ADAUSDC").quote, "USDC");
    }

    void testLoadOverridesPresentKeys() {
        const std::string path = writeTempConfig("full", R"({
            "backtest": { "symbol": "BTCUSDC", "start_ts": 1704067200000, "initial_cash": 500.5, "balance_epsilon": 1e-6 },
            "history": { "max_orders": 20 },
            "synthetic": { "seed": 7 },
            "store": { "sqlite_path": "/tmp/klines.db" },
            "log": { "level": "debug" },
            "rules": { "min_notional": 5 },
            "symbols": { "BTCUSDC": { "base": "BTC", "quote": "USDC" } }
        })");

        const util::AppConfig cfg = util::loadConfig(path);

        TEST_ASSERT_EQ(cfg.backtest.symbol, "BTCUSDC");
        TEST_ASSERT_EQ(cfg.backtest.timeframe, "1m");
        TEST_ASSERT_EQ(cfg.backtest.start_ts.value_or(0), 1704067200000LL);
        TEST_ASSERT(!cfg.backtest.end_ts.has_value());
        TEST_ASSERT_DOUBLE_EQ(cfg.backtest.initial_cash, 500.5);
        TEST_ASSERT(cfg.backtest.balance_epsilon == 1e-6);
        TEST_ASSERT_EQ(cfg.history.max_orders, static_cast<std::size_t>(20));
        TEST_ASSERT_EQ(cfg.history.window_ms, 86'400'000LL);
        TEST_ASSERT_EQ(cfg.synthetic.seed, static_cast<std::uint64_t>(7));
        TEST_ASSERT_EQ(cfg.store.sqlite_path, "/tmp/klines.db");
        TEST_ASSERT_EQ(cfg.log.level, "debug");
        TEST_ASSERT_DOUBLE_EQ(cfg.rules.min_notional, 5.0);
        TEST_ASSERT_DOUBLE_EQ(cfg.rules.tick_size, 0.0001);

        // symbols는 표 전체를 교체
        TEST_ASSERT_EQ(cfg.symbols.size(), static_cast<std::size_t>(1));
        TEST_ASSERT_EQ(cfg.symbols.at("BTCUSDC").base, "BTC");

        std::filesystem::remove(path);
    }

    void testMalformedConfigsFail() {
        TEST_ASSERT_THROWS(util::loadConfig("/nonexistent/coinsim.json"), std::runtime_error);

        const std::string broken = writeTempConfig("broken", "{ \"backtest\": ");
        TEST_ASSERT_THROWS(util::loadConfig(broken), std::runtime_error);

        const std::string wrong_type = writeTempConfig("type", R"({ "backtest": { "initial_cash": "lots" } })");
        TEST_ASSERT_THROWS(util::loadConfig(wrong_type), std::runtime_error);

        const std::string zero = writeTempConfig("zero", R"({ "history": { "max_orders": 0 } })");
        TEST_ASSERT_THROWS(util::loadConfig(zero), std::runtime_error);

        const std::string bad_symbols = writeTempConfig("symbols", R"({ "symbols": { "ADAUSDC": { "base": "ADA" } } })");
        TEST_ASSERT_THROWS(util::loadConfig(bad_symbols), std::runtime_error);

        for (const auto& p : { broken, wrong_type, zero, bad_symbols })
            std::filesystem::remove(p);
    }

    void testLogLevels() {
        TEST_ASSERT(util::parseLogLevel("debug") == util::LogLevel::DEBUG);
        TEST_ASSERT(util::parseLogLevel("WARN") == util::LogLevel::WARN);
        TEST_ASSERT(!util::parseLogLevel("verbose").has_value());

        util::LogConfig lc;
        lc.level = "error";
        util::applyLogConfig(lc);
        TEST_ASSERT(util::Logger::instance().level() == util::LogLevel::LV_ERROR);

        lc.level = "loud";
        TEST_ASSERT_THROWS(util::applyLogConfig(lc), std::invalid_argument);

        util::Logger::instance().setLevel(util::LogLevel::WARN);
    }

    bool runAllTests() {
        static const TestCase tests[] = {
            {"Defaults", testDefaults},
            {"LoadOverridesPresentKeys", testLoadOverridesPresentKeys},
            {"MalformedConfigsFail", testMalformedConfigsFail},
            {"LogLevels", testLogLevels},
        };
        return runSuite("Config Tests", tests);
    }

} // namespace test

int main() {
    return test::runAllTests() ? 0 : 1;
}
