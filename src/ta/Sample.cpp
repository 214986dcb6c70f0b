#include "sta/ta/Sample.hpp"

#include "sta/ta/Errors.hpp"

#include <algorithm>
#include <cmath>

namespace sta::ta {

DataItem::DataItem(double open, double high, double low, double close, double volume)
  : open_(open), high_(high), low_(low), close_(close), volume_(volume) {
  const bool finite = std::isfinite(open) && std::isfinite(high) && std::isfinite(low) &&
                      std::isfinite(close) && std::isfinite(volume);
  if (!finite)
    throw DataItemError(ErrorKind::DataItemInvalid, "DataItem: values must be finite");
  if (low > std::min(open, close) || high < std::max(open, close))
    throw DataItemError(ErrorKind::DataItemInvalid,
                        "DataItem: expected low <= open, close <= high");
  if (volume < 0.0)
    throw DataItemError(ErrorKind::DataItemInvalid, "DataItem: volume must be >= 0");
}

DataItem DataItem::Builder::build() const {
  if (!open_ || !high_ || !low_ || !close_ || !volume_)
    throw DataItemError(ErrorKind::DataItemIncomplete,
                        "DataItem: open, high, low, close and volume are all required");
  return DataItem(*open_, *high_, *low_, *close_, *volume_);
}

std::ostream& operator<<(std::ostream& os, const DataItem& d) {
  return os << "{o=" << d.open() << " h=" << d.high() << " l=" << d.low()
            << " c=" << d.close() << " v=" << d.volume() << '}';
}

} // namespace sta::ta
