#include "backtest/domain/error.hpp"

namespace backtest {
namespace domain {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "None";
    case ErrorKind::ValidationFailed:
      return "ValidationFailed";
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::NoOpenPosition:
      return "NoOpenPosition";
    case ErrorKind::InsufficientFunds:
      return "InsufficientFunds";
    case ErrorKind::InsufficientQuantity:
      return "InsufficientQuantity";
    case ErrorKind::InvalidStopPrice:
      return "InvalidStopPrice";
    case ErrorKind::DataNotFound:
      return "DataNotFound";
    case ErrorKind::TemporalViolation:
      return "TemporalViolation";
    case ErrorKind::Internal:
      return "Internal";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace backtest
