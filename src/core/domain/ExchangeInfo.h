// core/domain/ExchangeInfo.h
#pragma once

#include <string>
#include <vector>

#include "Types.h"

namespace core
{
	/*
	* 거래 규칙 메타데이터 (고정 fixture 값)
	* - LOT_SIZE: 수량 단위
	* - PRICE_FILTER: 가격 단위
	* - MIN_NOTIONAL: 최소 주문 금액
	*/
	struct SymbolRules
	{
		std::string		symbol;
		int				base_asset_precision{ 8 };
		int				quote_asset_precision{ 8 };
		Volume			step_size{ 0.1 };
		Price			tick_size{ 0.0001 };
		Amount			min_notional{ 10.0 };
	};

	struct ExchangeInfo
	{
		std::vector<SymbolRules> symbols;
	};
}
