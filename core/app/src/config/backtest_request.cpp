#include "backtest/config/backtest_request.hpp"

#include <fstream>
#include <sstream>

namespace backtest {

namespace {

Timestamp requireDate(const nlohmann::json& json, const char* key) {
  if (!json.contains(key)) {
    throw ConfigError(std::string("Missing required field '") + key + "'");
  }
  const std::string text = json.at(key).get<std::string>();
  const std::optional<Timestamp> date = parse_date(text);
  if (!date) {
    throw ConfigError(std::string("Field '") + key +
                      "' is not a valid date: " + text);
  }
  return *date;
}

std::optional<double> optionalDouble(const nlohmann::json& json,
                                     const char* key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

SaleCommissionPolicy parseSaleCommission(const std::string& text) {
  if (text == "deduct") {
    return SaleCommissionPolicy::DeductFromProceeds;
  }
  if (text == "report_only") {
    return SaleCommissionPolicy::ReportOnly;
  }
  throw ConfigError("Unknown saleCommission '" + text +
                    "' (expected \"deduct\" or \"report_only\")");
}

StrategyParams parseStrategy(const nlohmann::json& json) {
  const std::string type =
      json.value("strategyType", std::string(kMovingAverageCrossoverType));

  if (type == kMovingAverageCrossoverType) {
    MovingAverageCrossoverParams params;
    if (json.contains("symbols")) {
      params.symbols = json.at("symbols").get<std::vector<std::string>>();
    }
    params.short_period = json.value("shortPeriod", params.short_period);
    params.long_period = json.value("longPeriod", params.long_period);
    params.position_size = json.value("positionSize", params.position_size);
    if (json.contains("stopLoss")) {
      params.stop_loss = parseStopLoss(json.at("stopLoss"));
    }

    if (params.short_period <= 0 || params.long_period <= params.short_period) {
      throw ConfigError("shortPeriod must be positive and less than longPeriod");
    }
    if (params.position_size <= 0) {
      throw ConfigError("positionSize must be positive");
    }
    return params;
  }

  throw ConfigError("Unknown strategyType '" + type + "'");
}

}  // namespace

domain::StopLoss parseStopLoss(const nlohmann::json& json) {
  if (json.is_null()) {
    return domain::NoStopLoss{};
  }
  if (!json.is_object()) {
    throw ConfigError("stopLoss must be an object");
  }

  const auto price = optionalDouble(json, "priceThreshold");
  const bool has_days = json.contains("daysToHold") && !json.at("daysToHold").is_null();
  const auto trailing = optionalDouble(json, "trailingPercent");

  const int configured = (price ? 1 : 0) + (has_days ? 1 : 0) + (trailing ? 1 : 0);
  if (configured > 1) {
    throw ConfigError(
        "stopLoss accepts only one of priceThreshold, daysToHold, "
        "trailingPercent");
  }

  if (price) {
    if (*price <= 0.0) {
      throw ConfigError("stopLoss.priceThreshold must be positive");
    }
    return domain::PriceStopLoss{*price};
  }
  if (has_days) {
    const auto days = json.at("daysToHold").get<std::int64_t>();
    if (days < 0) {
      throw ConfigError("stopLoss.daysToHold must not be negative");
    }
    return domain::DaysStopLoss{days};
  }
  if (trailing) {
    return domain::TrailingStopLoss{*trailing};
  }
  return domain::NoStopLoss{};
}

domain::Bar parseBar(const std::string& symbol, const nlohmann::json& json) {
  try {
    domain::Bar bar;
    bar.symbol = symbol;
    bar.timestamp = requireDate(json, "date");
    bar.close = json.at("close").get<double>();
    bar.open = json.value("open", bar.close);
    bar.high = json.value("high", bar.close);
    bar.low = json.value("low", bar.close);
    bar.adjusted_close = json.value("adjustedClose", bar.close);
    bar.volume = json.value("volume", std::int64_t{0});

    bar.indicators.macd = optionalDouble(json, "macd");
    bar.indicators.macd_signal = optionalDouble(json, "macdSignal");
    bar.indicators.macd_histogram = optionalDouble(json, "macdHistogram");
    bar.indicators.sma_200 = optionalDouble(json, "sma200");
    bar.indicators.sma_50 = optionalDouble(json, "sma50");
    bar.indicators.vol_ma_20 = optionalDouble(json, "volMa20");
    bar.indicators.rsi_14 = optionalDouble(json, "rsi14");

    if (!(bar.close > 0.0)) {
      throw ConfigError("Bar close must be positive");
    }
    return bar;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("Invalid bar for " + symbol + ": " + e.what());
  }
}

// -----------------------------------------------------------------------------
// parseBacktestRequest: field-by-field, nlohmann errors wrapped as ConfigError
// -----------------------------------------------------------------------------
BacktestRequest parseBacktestRequest(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw ConfigError("Backtest request must be a JSON object");
  }

  try {
    BacktestRequest request;

    if (!json.contains("accountId")) {
      throw ConfigError("Missing required field 'accountId'");
    }
    request.account_id = json.at("accountId").get<domain::AccountId>();
    request.account_name = json.value("accountName", request.account_name);

    request.start_date = requireDate(json, "startDate");
    request.end_date = requireDate(json, "endDate");
    if (request.start_date > request.end_date) {
      throw ConfigError("startDate must not be after endDate");
    }

    if (!json.contains("initialCapital")) {
      throw ConfigError("Missing required field 'initialCapital'");
    }
    request.initial_capital = json.at("initialCapital").get<double>();
    if (!(request.initial_capital > 0.0)) {
      throw ConfigError("initialCapital must be positive");
    }

    request.strategy = parseStrategy(json);

    if (json.contains("riskLimits")) {
      const auto& limits = json.at("riskLimits");
      request.risk_limits.max_position_fraction = limits.value(
          "maxPositionFraction", request.risk_limits.max_position_fraction);
      request.risk_limits.estimated_commission = limits.value(
          "estimatedCommission", request.risk_limits.estimated_commission);
    }

    request.commission = json.value("commission", request.commission);
    if (request.commission < 0.0) {
      throw ConfigError("commission must not be negative");
    }
    if (json.contains("saleCommission")) {
      request.sale_commission =
          parseSaleCommission(json.at("saleCommission").get<std::string>());
    }

    request.lookback_days = json.value("lookbackDays", request.lookback_days);
    if (request.lookback_days < 0) {
      throw ConfigError("lookbackDays must not be negative");
    }

    if (json.contains("bars")) {
      for (const auto& [symbol, series] : json.at("bars").items()) {
        if (!series.is_array()) {
          throw ConfigError("bars." + symbol + " must be an array");
        }
        auto& bars = request.bars[symbol];
        for (const auto& bar_json : series) {
          bars.push_back(parseBar(symbol, bar_json));
        }
      }
    }

    return request;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Invalid backtest request: ") + e.what());
  }
}

BacktestRequest parseBacktestRequestText(const std::string& text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("Malformed JSON: ") + e.what());
  }
  return parseBacktestRequest(json);
}

BacktestRequest loadBacktestRequest(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open request file " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseBacktestRequestText(buffer.str());
}

}  // namespace backtest
