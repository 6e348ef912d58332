#include "tether/ratelimit/operation_class.hpp"

namespace tether {

const char* toString(OperationClass op) {
  switch (op) {
    case OperationClass::General:        return "general";
    case OperationClass::Order:          return "order";
    case OperationClass::HistoricalData: return "historical_data";
    case OperationClass::MarketData:     return "market_data";
  }
  return "unknown";
}

std::optional<OperationClass> parseOperationClass(std::string_view name) {
  if (name == "general") return OperationClass::General;
  if (name == "order") return OperationClass::Order;
  if (name == "historical_data") return OperationClass::HistoricalData;
  if (name == "market_data") return OperationClass::MarketData;
  return std::nullopt;
}

}  // namespace tether
