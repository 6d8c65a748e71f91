#include "../../include/server/stats_collector.hpp"
#include "../../include/utils/json_parser.hpp"
#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>

namespace rendezvous {

namespace {

const size_t kTopRooms = 10;

const char* sizeBucket(int64_t participants) {
    if (participants <= 5) return "1-5";
    if (participants <= 10) return "6-10";
    if (participants <= 25) return "11-25";
    if (participants <= 50) return "26-50";
    return "51+";
}

} // namespace

StatsCollector::StatsCollector(std::shared_ptr<RoomRegistry> registry,
                               std::shared_ptr<SignalingBridge> bridge,
                               std::shared_ptr<FileTransferManager> transfers,
                               const std::string& instance_id,
                               Clock clock)
    : registry_(std::move(registry))
    , bridge_(std::move(bridge))
    , transfers_(std::move(transfers))
    , instance_id_(instance_id)
    , clock_(std::move(clock))
    , started_at_(clock_()) {
}

std::vector<StatsCollector::RoomSize> StatsCollector::roomSizes() {
    std::vector<RoomSize> sizes;
    for (const auto& room_id : registry_->activeRooms()) {
        const int64_t count = registry_->memberCount(room_id);
        if (count > 0) {
            sizes.push_back(RoomSize{room_id, count});
        }
    }
    return sizes;
}

std::string StatsCollector::metricsJson() {
    const std::vector<RoomSize> rooms = roomSizes();
    int64_t participants = 0;
    for (const auto& room : rooms) {
        participants += room.participants;
    }
    const double average = rooms.empty() ? 0.0 : static_cast<double>(participants) / rooms.size();

    int64_t open_transfers = 0;
    for (const auto& entry : transfers_->countByStatus()) {
        if (!isTerminal(transferStatusFromName(entry.first))) {
            open_transfers += entry.second;
        }
    }

    std::ostringstream oss;
    oss << "{"
        << "\"instance_id\":" << JsonParser::quote(instance_id_) << ","
        << "\"uptime_seconds\":" << (clock_() - started_at_) / 1000 << ","
        << "\"active_rooms\":" << rooms.size() << ","
        << "\"total_participants\":" << participants << ","
        << "\"average_participants_per_room\":" << std::fixed << std::setprecision(2) << average << ","
        << "\"local_connections\":" << bridge_->localEndpointCount() << ","
        << "\"active_transfers\":" << open_transfers
        << "}";
    return oss.str();
}

std::string StatsCollector::statsJson() {
    std::vector<RoomSize> rooms = roomSizes();

    std::map<std::string, int64_t> buckets = {{"1-5", 0}, {"6-10", 0}, {"11-25", 0}, {"26-50", 0}, {"51+", 0}};
    for (const auto& room : rooms) {
        buckets[sizeBucket(room.participants)]++;
    }

    std::sort(rooms.begin(), rooms.end(), [](const RoomSize& a, const RoomSize& b) {
        return a.participants > b.participants || (a.participants == b.participants && a.room_id < b.room_id);
    });
    if (rooms.size() > kTopRooms) {
        rooms.resize(kTopRooms);
    }

    std::ostringstream oss;
    oss << "{\"timestamp\":" << JsonParser::quote(formatIsoTimestamp(clock_())) << ",";

    // Fixed bucket order, smallest first
    oss << "\"rooms_by_size\":{";
    const char* order[] = {"1-5", "6-10", "11-25", "26-50", "51+"};
    for (size_t i = 0; i < 5; ++i) {
        if (i > 0) oss << ",";
        oss << JsonParser::quote(order[i]) << ":" << buckets[order[i]];
    }
    oss << "},";

    oss << "\"top_rooms\":[";
    for (size_t i = 0; i < rooms.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "{\"room_id\":" << JsonParser::quote(rooms[i].room_id)
            << ",\"participant_count\":" << rooms[i].participants << "}";
    }
    oss << "],";

    oss << "\"transfers_by_status\":{";
    bool first = true;
    for (const auto& entry : transfers_->countByStatus()) {
        if (!first) oss << ",";
        first = false;
        oss << JsonParser::quote(entry.first) << ":" << entry.second;
    }
    oss << "}}";
    return oss.str();
}

} // namespace rendezvous
