// core/domain/Account.h
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Types.h"

namespace core 
{
	// 자산 하나의 잔고 (free = total - locked)
	struct AssetBalance
	{
		std::string		asset;			// 자산 코드 (예: "USDC")
		Amount			free{ 0.0 };	// 주문 가능 수량
		Amount			locked{ 0.0 };	// 미체결 주문에 예약된 수량
	};

	/*
	* 계좌 스냅샷
	* 거래소 get_account 응답의 balances 배열과 같은 모양
	*/
	struct AccountSnapshot 
	{
		std::vector<AssetBalance> balances;

		std::optional<AssetBalance> find(std::string_view asset) const
		{
			for (const auto& b : balances)
			{
				if (b.asset == asset)
					return b;
			}
			return std::nullopt;
		}
	};
}
