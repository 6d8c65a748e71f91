#include "../../include/transfer/file_transfer.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace rendezvous {

const char* transferStatusName(TransferStatus status) {
    switch (status) {
        case TransferStatus::Offered: return "offered";
        case TransferStatus::Accepted: return "accepted";
        case TransferStatus::Active: return "active";
        case TransferStatus::Paused: return "paused";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed: return "failed";
        case TransferStatus::Cancelled: return "cancelled";
        case TransferStatus::Rejected: return "rejected";
    }
    return "failed";
}

TransferStatus transferStatusFromName(const std::string& name) {
    if (name == "offered") return TransferStatus::Offered;
    if (name == "accepted") return TransferStatus::Accepted;
    if (name == "active") return TransferStatus::Active;
    if (name == "paused") return TransferStatus::Paused;
    if (name == "completed") return TransferStatus::Completed;
    if (name == "failed") return TransferStatus::Failed;
    if (name == "cancelled") return TransferStatus::Cancelled;
    if (name == "rejected") return TransferStatus::Rejected;
    throw ValidationError("Unknown transfer status '" + name + "'");
}

bool isTerminal(TransferStatus status) {
    switch (status) {
        case TransferStatus::Completed:
        case TransferStatus::Failed:
        case TransferStatus::Cancelled:
        case TransferStatus::Rejected:
            return true;
        case TransferStatus::Offered:
        case TransferStatus::Accepted:
        case TransferStatus::Active:
        case TransferStatus::Paused:
            return false;
    }
    return false;
}

int64_t FileTransfer::chunkLength(int64_t index) const {
    if (index < total_chunks - 1) {
        return chunk_size;
    }
    return size_bytes - chunk_size * (total_chunks - 1);
}

std::string FileTransfer::toJson() const {
    std::ostringstream oss;
    oss << "{"
        << "\"transfer_id\":" << JsonParser::quote(transfer_id) << ","
        << "\"room_id\":" << JsonParser::quote(room_id) << ","
        << "\"sender_id\":" << JsonParser::quote(sender_id) << ","
        << "\"receiver_id\":" << JsonParser::quote(receiver_id) << ","
        << "\"filename\":" << JsonParser::quote(filename) << ","
        << "\"size_bytes\":" << size_bytes << ","
        << "\"mime_type\":" << JsonParser::quote(mime_type) << ","
        << "\"chunk_size\":" << chunk_size << ","
        << "\"total_chunks\":" << total_chunks << ","
        << "\"chunks_acked\":" << chunks_acked << ","
        << "\"status\":\"" << transferStatusName(status) << "\","
        << "\"checksum_expected\":" << JsonParser::quote(checksum_expected) << ","
        << "\"checksum_actual\":" << JsonParser::quote(checksum_actual) << ","
        << "\"error\":" << JsonParser::quote(error) << ","
        << "\"storage_path\":" << JsonParser::quote(storage_path) << ","
        << "\"created_at\":" << created_at << ","
        << "\"last_activity_at\":" << last_activity_at << ","
        << "\"completed_at\":" << completed_at
        << "}";
    return oss.str();
}

FileTransfer FileTransfer::fromJson(const std::string& json) {
    auto fields = JsonParser::parseObject(json);
    FileTransfer transfer;
    transfer.transfer_id = JsonParser::getString(fields, "transfer_id");
    transfer.room_id = JsonParser::getString(fields, "room_id");
    transfer.sender_id = JsonParser::getString(fields, "sender_id");
    transfer.receiver_id = JsonParser::getString(fields, "receiver_id");
    transfer.filename = JsonParser::getString(fields, "filename");
    transfer.size_bytes = JsonParser::getInt(fields, "size_bytes");
    transfer.mime_type = JsonParser::getString(fields, "mime_type");
    transfer.chunk_size = JsonParser::getInt(fields, "chunk_size");
    transfer.total_chunks = JsonParser::getInt(fields, "total_chunks");
    transfer.chunks_acked = JsonParser::getInt(fields, "chunks_acked");
    try {
        transfer.status = transferStatusFromName(JsonParser::getString(fields, "status"));
    } catch (const ValidationError& e) {
        throw std::invalid_argument(e.what());
    }
    transfer.checksum_expected = JsonParser::getString(fields, "checksum_expected");
    transfer.checksum_actual = JsonParser::getString(fields, "checksum_actual");
    transfer.error = JsonParser::getString(fields, "error");
    transfer.storage_path = JsonParser::getString(fields, "storage_path");
    transfer.created_at = JsonParser::getInt(fields, "created_at");
    transfer.last_activity_at = JsonParser::getInt(fields, "last_activity_at");
    transfer.completed_at = JsonParser::getInt(fields, "completed_at");
    if (transfer.transfer_id.empty()) {
        throw std::invalid_argument("transfer record has no transfer_id");
    }
    return transfer;
}

std::string FileTransfer::toViewJson() const {
    const double percent = total_chunks > 0 ? 100.0 * static_cast<double>(chunks_acked) / total_chunks : 0.0;
    std::ostringstream oss;
    oss << "{"
        << "\"transfer_id\":" << JsonParser::quote(transfer_id) << ","
        << "\"room_id\":" << JsonParser::quote(room_id) << ","
        << "\"sender_id\":" << JsonParser::quote(sender_id) << ","
        << "\"receiver_id\":" << JsonParser::quote(receiver_id) << ","
        << "\"filename\":" << JsonParser::quote(filename) << ","
        << "\"size_bytes\":" << size_bytes << ","
        << "\"mime_type\":" << JsonParser::quote(mime_type) << ","
        << "\"chunk_size\":" << chunk_size << ","
        << "\"total_chunks\":" << total_chunks << ","
        << "\"chunks_acked\":" << chunks_acked << ","
        << "\"percent\":" << std::fixed << std::setprecision(2) << percent << ","
        << "\"status\":\"" << transferStatusName(status) << "\","
        << "\"checksum_expected\":"
        << (checksum_expected.empty() ? std::string("null") : JsonParser::quote(checksum_expected)) << ","
        << "\"checksum_actual\":"
        << (checksum_actual.empty() ? std::string("null") : JsonParser::quote(checksum_actual)) << ","
        << "\"error\":" << (error.empty() ? std::string("null") : JsonParser::quote(error)) << ","
        << "\"created_at\":" << JsonParser::quote(formatIsoTimestamp(created_at)) << ","
        << "\"completed_at\":"
        << (completed_at > 0 ? JsonParser::quote(formatIsoTimestamp(completed_at)) : std::string("null"))
        << "}";
    return oss.str();
}

std::string TransferProgress::toJson(const std::string& transfer_id) const {
    std::ostringstream oss;
    oss << "{"
        << "\"transfer_id\":" << JsonParser::quote(transfer_id) << ","
        << "\"percent\":" << std::fixed << std::setprecision(2) << percent << ","
        << "\"chunks_acked\":" << chunks_acked << ","
        << "\"total_chunks\":" << total_chunks << ","
        << "\"status\":\"" << transferStatusName(status) << "\""
        << "}";
    return oss.str();
}

} // namespace rendezvous
