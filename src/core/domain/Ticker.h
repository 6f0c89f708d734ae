// core/domain/Ticker.h
#pragma once

#include <string>

#include "Types.h"

namespace core {

    // 최신 가격 (커서 캔들의 종가)
    struct Ticker {
        std::string     symbol;
        Price           price{ 0.0 };
    };

} // namespace core
