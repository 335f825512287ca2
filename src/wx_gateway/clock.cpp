#include "wx_gateway/clock.hpp"

namespace wx_gateway {

TimePoint SystemClock::now() const {
    return WallClock::now();
}

}  // namespace wx_gateway
