#include "backtest/market/historical_market_data.hpp"
#include "backtest/domain/error.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>

namespace backtest {

namespace {

bool earlier(const domain::Bar& a, const domain::Bar& b) {
  return a.timestamp < b.timestamp;
}

}  // namespace

HistoricalMarketData::HistoricalMarketData(const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

// -----------------------------------------------------------------------------
// addBars: stable sort, then drop duplicate timestamps keeping the last one
// -----------------------------------------------------------------------------
void HistoricalMarketData::addBars(const std::string& symbol,
                                   std::vector<domain::Bar> bars) {
  for (auto& bar : bars) {
    bar.symbol = symbol;
  }

  std::unique_lock lock(mutex_);
  std::vector<domain::Bar>& series = bars_[symbol];
  series.insert(series.end(), std::make_move_iterator(bars.begin()),
                std::make_move_iterator(bars.end()));

  std::stable_sort(series.begin(), series.end(), earlier);

  // After a stable sort, equal timestamps keep load order. Walk backwards so
  // the last loaded bar of each run survives.
  std::vector<domain::Bar> deduped;
  deduped.reserve(series.size());
  for (auto it = series.rbegin(); it != series.rend(); ++it) {
    if (deduped.empty() || deduped.back().timestamp != it->timestamp) {
      deduped.push_back(std::move(*it));
    }
  }
  std::reverse(deduped.begin(), deduped.end());
  series = std::move(deduped);
}

std::vector<std::string> HistoricalMarketData::symbols() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> result;
  result.reserve(bars_.size());
  for (const auto& [symbol, series] : bars_) {
    if (!series.empty()) {
      result.push_back(symbol);
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

Timestamp HistoricalMarketData::currentTime() const {
  return ms_to_timestamp(time_provider_.now_ms());
}

// -----------------------------------------------------------------------------
// priceAt: lookahead guard first, then the at-or-before lookup
// -----------------------------------------------------------------------------
domain::Bar HistoricalMarketData::priceAt(const std::string& symbol,
                                          Timestamp as_of) const {
  const Timestamp now = currentTime();
  if (as_of > now) {
    throw domain::TemporalViolation(
        "Cannot access future data: requested " + format_date(as_of) +
        " for " + symbol + ", current simulation time is " +
        format_date(now));
  }

  std::shared_lock lock(mutex_);
  const domain::Bar* bar = latestAtOrBefore(symbol, as_of);
  if (bar == nullptr) {
    throw domain::DataNotFound("No price data available for " + symbol +
                               " on or before " + format_date(as_of));
  }
  return *bar;
}

std::vector<domain::Bar> HistoricalMarketData::history(
    const std::string& symbol, Timestamp start, Timestamp end) const {
  const Timestamp effective_end = std::min(end, currentTime());

  std::vector<domain::Bar> result;
  if (start > effective_end) {
    return result;
  }

  std::shared_lock lock(mutex_);
  auto it = bars_.find(symbol);
  if (it == bars_.end()) {
    return result;
  }

  const auto& series = it->second;
  domain::Bar key;
  key.timestamp = start;
  auto first = std::lower_bound(series.begin(), series.end(), key, earlier);
  key.timestamp = effective_end;
  auto last = std::upper_bound(first, series.end(), key, earlier);

  result.assign(first, last);
  return result;
}

bool HistoricalMarketData::isAvailable(const std::string& symbol,
                                       Timestamp as_of) const {
  if (as_of > currentTime()) {
    return false;
  }
  std::shared_lock lock(mutex_);
  return latestAtOrBefore(symbol, as_of) != nullptr;
}

const domain::Bar* HistoricalMarketData::latestAtOrBefore(
    const std::string& symbol, Timestamp as_of) const {
  auto it = bars_.find(symbol);
  if (it == bars_.end()) {
    return nullptr;
  }

  const auto& series = it->second;
  domain::Bar key;
  key.timestamp = as_of;
  // First bar strictly after as_of; the one before it is the answer.
  auto after = std::upper_bound(series.begin(), series.end(), key, earlier);
  if (after == series.begin()) {
    return nullptr;
  }
  return &*std::prev(after);
}

std::vector<domain::Bar> selectLookbackWindow(
    const std::vector<domain::Bar>& bars,
    Timestamp start,
    Timestamp end,
    std::int64_t lookback_days) {
  const Timestamp window_start = add_days(start, -lookback_days);

  std::vector<domain::Bar> result;
  for (const auto& bar : bars) {
    if (bar.timestamp >= window_start && bar.timestamp <= end) {
      result.push_back(bar);
    }
  }
  return result;
}

}  // namespace backtest
