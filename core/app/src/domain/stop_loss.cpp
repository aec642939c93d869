#include "backtest/domain/stop_loss.hpp"

#include <iomanip>
#include <sstream>

namespace backtest {
namespace domain {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

std::string describe(const StopLoss& stop_loss) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  std::visit(Overloaded{
                 [&out](const NoStopLoss&) { out << "none"; },
                 [&out](const PriceStopLoss& s) {
                   out << "price<=" << s.threshold;
                 },
                 [&out](const DaysStopLoss& s) { out << "days>=" << s.days; },
                 [&out](const TrailingStopLoss& s) {
                   out << "trailing " << s.percent << "%";
                 },
             },
             stop_loss);
  return out.str();
}

}  // namespace domain
}  // namespace backtest
