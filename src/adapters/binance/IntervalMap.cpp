#include "adapters/binance/IntervalMap.hpp"

#include <algorithm>
#include <vector>

namespace adapters::binance {

std::string supported_intervals_list() {
    std::vector<std::string_view> sorted(kSupportedIntervals.begin(), kSupportedIntervals.end());
    std::sort(sorted.begin(), sorted.end());

    std::string joined;
    for (auto value : sorted) {
        if (!joined.empty()) {
            joined.append(", ");
        }
        joined.append(value);
    }
    return joined;
}

}  // namespace adapters::binance
