#ifndef STATS_COLLECTOR_HPP
#define STATS_COLLECTOR_HPP

#include "../signaling/room_registry.hpp"
#include "../signaling/signaling_bridge.hpp"
#include "../transfer/file_transfer_manager.hpp"
#include "../utils/time_utils.hpp"
#include <memory>
#include <string>
#include <vector>

namespace rendezvous {

/**
 * Realtime counters for /metrics and /stats. Room figures come from the
 * coordination store and cover every instance; connection counts are
 * local to this instance.
 */
class StatsCollector {
public:
    StatsCollector(std::shared_ptr<RoomRegistry> registry,
                   std::shared_ptr<SignalingBridge> bridge,
                   std::shared_ptr<FileTransferManager> transfers,
                   const std::string& instance_id,
                   Clock clock = systemClock());

    // Totals: rooms, participants, local connections, open transfers
    std::string metricsJson();

    // Breakdown: rooms by size bucket, the ten largest rooms, transfers by status
    std::string statsJson();

private:
    struct RoomSize {
        std::string room_id;
        int64_t participants = 0;
    };

    std::vector<RoomSize> roomSizes();

    std::shared_ptr<RoomRegistry> registry_;
    std::shared_ptr<SignalingBridge> bridge_;
    std::shared_ptr<FileTransferManager> transfers_;
    std::string instance_id_;
    Clock clock_;
    int64_t started_at_;
};

} // namespace rendezvous

#endif // STATS_COLLECTOR_HPP
