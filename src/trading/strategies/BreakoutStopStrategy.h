#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "backtest/IStrategy.h"
#include "core/domain/OrderRequest.h"
#include "trading/indicators/PriceChannel.h"

namespace trading::strategies {

    /*
        Breakout Stop (Donchian 돌파)
        - symbol_ 은 생성 시 고정 (단일 종목 전용 인스턴스)
        - 상태 머신:
            Flat -> PendingEntry (채널 상단 BUY 스탑 대기) -> InPosition
            InPosition -> PendingExit (채널 하단 SELL 스탑 대기) -> Flat
        - 진입 스탑이 entryTimeout 캔들 동안 안 걸리면 취소 후 Flat
        - 채널은 "직전" N개 캔들 기준 (현재 캔들은 next() 끝에서 반영)
    */
    class BreakoutStopStrategy final : public backtest::IStrategy {
    public:
        struct Params final {
            std::size_t channelLength{ 20 };
            double riskPercent{ 10.0 };         // 진입에 쓸 quote 잔고 비율 (%)
            std::size_t entryTimeout{ 5 };      // 진입 스탑 유지 캔들 수
        };

        enum class State : std::uint8_t {
            Flat = 0,
            PendingEntry = 1,
            InPosition = 2,
            PendingExit = 3
        };

    public:
        BreakoutStopStrategy(std::string symbol, Params p);

        void init(api::IExchangeClient& exchange) override;
        void next(api::IExchangeClient& exchange, const core::Candle& candle) override;

        [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }
        [[nodiscard]] State state() const noexcept { return state_; }
        [[nodiscard]] double entryPrice() const noexcept { return entry_price_.value_or(0.0); }
        [[nodiscard]] std::size_t tradeCount() const noexcept { return trades_; }
        [[nodiscard]] std::size_t rejectCount() const noexcept { return rejects_; }

    private:
        // 주문이 아직 미체결 목록에 있으면 true
        [[nodiscard]] bool isOpen(api::IExchangeClient& exchange, core::OrderId id) const;

        void maybeEnter(api::IExchangeClient& exchange, const core::Candle& candle);
        void maybeExit(api::IExchangeClient& exchange, const core::Candle& candle);

        // step_size 내림
        [[nodiscard]] double roundDownToStep(double qty) const noexcept;

        [[nodiscard]] core::OrderRequest makeStop(core::OrderSide side, double qty, double stop, std::string_view tag);

    private:
        std::string symbol_;
        Params params_{};

        State state_{ State::Flat };
        std::optional<core::OrderId> pending_id_{};
        std::size_t pending_age_{ 0 };

        std::optional<double> entry_price_{};
        double position_qty_{ 0.0 };

        // init()에서 exchange info로 채움
        std::string base_asset_{};
        std::string quote_asset_{};
        double step_size_{ 0.0 };

        trading::indicators::PriceChannel channel_{};

        std::uint64_t seq_{ 0 };
        std::size_t trades_{ 0 };
        std::size_t rejects_{ 0 };
    };

} // namespace trading::strategies
