#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "core/domain/ExchangeInfo.h"
#include "core/domain/Instrument.h"
#include "core/domain/Types.h"

namespace util
{
    // 백테스트 실행 설정
    struct BacktestConfig
    {
        std::string symbol = "ADAUSDC";
        std::string timeframe = "1m";
        std::optional<core::TimestampMs> start_ts;     // 없으면 저장소 처음부터
        std::optional<core::TimestampMs> end_ts;       // 없으면 저장소 끝까지

        double initial_cash = 10000.0;                  // 초기 quote 잔고
        double commission_rate = 0.0;                   // Ledger 자체 매수/매도 수수료 (체결 경로는 면제)
        double balance_epsilon = 1e-9;                  // 예약 가능 잔고 비교 오차 (부동소수점 잔차)
    };

    // 체결 주문 이력 보관 정책
    // - 개수 상한 + 최신 주문 기준 시간 창, 둘 다 적용
    struct HistoryConfig
    {
        std::size_t max_orders = 100;
        core::TimestampMs window_ms = 24LL * 60 * 60 * 1000;   // 1일
    };

    // 가상 과거 주문 생성 설정
    // 생성 개수 = min(max_orders, 캔들 수 / series_divisor)
    struct SyntheticConfig
    {
        std::size_t max_orders = 50;
        std::size_t series_divisor = 10;
        std::uint64_t seed = 42;
    };

    // 저장소 설정
    struct StoreConfig
    {
        std::string sqlite_path = "data/backtest.db";
    };

    // 로그 설정
    struct LogConfig
    {
        std::string level = "info";
        std::string file;                               // 비어 있으면 콘솔만
    };

    // 통합 설정
    struct AppConfig
    {
        BacktestConfig backtest;
        HistoryConfig history;
        SyntheticConfig synthetic;
        StoreConfig store;
        LogConfig log;

        // 거래 규칙 fixture (exchange info 응답용)
        core::SymbolRules rules{ "ADAUSDC", 8, 8, 0.1, 0.0001, 10.0 };

        // symbol -> (base, quote), 심볼 메타데이터 조회 테이블
        std::map<std::string, core::Instrument> symbols{
            { "ADAUSDC", core::Instrument{ "ADAUSDC", "ADA", "USDC" } },
        };
    };

    /*
     * JSON 설정 파일 로드
     * - 누락된 키는 기본값 유지
     * - 파일 없음/파싱 실패/타입 불일치는 std::runtime_error
     */
    AppConfig loadConfig(const std::string& path);

    // 로그 설정을 Logger에 반영 (잘못된 level 문자열은 std::invalid_argument)
    void applyLogConfig(const LogConfig& cfg);

} // namespace util
