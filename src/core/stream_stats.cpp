#include "core/stream_stats.hpp"

namespace jugsync {

StreamStatsSnapshot StreamStats::snapshot() const {
    return StreamStatsSnapshot{
        received_.load(),
        parse_errors_.load(),
        completed_.load(),
        stale_dropped_.load(),
        queue_dropped_.load(),
        reconnects_.load()};
}

}  // namespace jugsync
