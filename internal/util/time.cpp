#include "time.hpp"

namespace llrp::util {

SteadyPoint SteadyNow() {
  return SteadyClock::now();
}

} // namespace llrp::util
