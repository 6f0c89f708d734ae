// src/backtest/Ledger.cpp

#include "Ledger.h"

#include <cmath>
#include <stdexcept>

namespace backtest {

    Ledger::Ledger(core::Amount initial_cash,
                   double commission_rate,
                   PositionMap initial_positions)
        : initial_cash_(initial_cash)
        , cash_(initial_cash)
        , fee_(commission_rate)
        , positions_(std::move(initial_positions))
    {
        // 생성 단계에서 잘못된 장부는 만들지 않는다
        if (!std::isfinite(initial_cash) || initial_cash < 0) {
            throw std::invalid_argument("Ledger: initial cash must be >= 0");
        }
        if (!fee_.valid()) {
            throw std::invalid_argument("Ledger: commission rate must be in [0, 1)");
        }
        for (const auto& [symbol, qty] : positions_) {
            if (!std::isfinite(qty) || qty < 0) {
                throw std::invalid_argument("Ledger: initial position for " + symbol + " must be >= 0");
            }
        }
    }

    bool Ledger::applyBuy(std::string_view symbol, core::Volume quantity, core::Price price,
                          Commission mode)
    {
        const core::Amount cost = quantity * price;
        const core::Amount total_cost = fee_.buyTotalCost(cost, mode);

        if (cash_ < total_cost) {
            return false;
        }

        cash_ -= total_cost;

        auto it = positions_.find(symbol);
        if (it == positions_.end()) {
            positions_.emplace(std::string(symbol), quantity);
        } else {
            it->second += quantity;
        }
        return true;
    }

    bool Ledger::applySell(std::string_view symbol, core::Volume quantity, core::Price price,
                           Commission mode)
    {
        auto it = positions_.find(symbol);
        if (it == positions_.end() || it->second < quantity) {
            return false;
        }

        const core::Amount revenue = quantity * price;
        cash_ += fee_.sellNetProceeds(revenue, mode);
        it->second -= quantity;
        return true;
    }

    core::Amount Ledger::portfolioValue(const PriceMap& prices) const
    {
        core::Amount value = cash_;
        for (const auto& [symbol, qty] : positions_) {
            if (qty <= 0) {
                continue;
            }
            auto pit = prices.find(symbol);
            if (pit != prices.end()) {
                value += qty * pit->second;
            }
        }
        return value;
    }

    core::Volume Ledger::position(std::string_view symbol) const
    {
        auto it = positions_.find(symbol);
        return it == positions_.end() ? 0.0 : it->second;
    }

} // namespace backtest
