#pragma once

#include <optional>
#include <string_view>

namespace tether {

// -----------------------------------------------------------------------------
// OperationClass — quota dimension an outbound call is charged against
// -----------------------------------------------------------------------------
//   General        → general token bucket
//   Order          → general bucket AND the order bucket
//   HistoricalData → ten-minute sliding window, then the general bucket
//   MarketData     → subscription ceiling, then the general bucket
// -----------------------------------------------------------------------------
enum class OperationClass { General, Order, HistoricalData, MarketData };

// "general", "order", "historical_data", "market_data"
const char* toString(OperationClass op);

// Inverse of toString(); std::nullopt for unknown names.
std::optional<OperationClass> parseOperationClass(std::string_view name);

}  // namespace tether
