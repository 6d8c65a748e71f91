#ifndef FILE_TRANSFER_HPP
#define FILE_TRANSFER_HPP

#include <string>
#include <optional>
#include <cstdint>

namespace rendezvous {

enum class TransferStatus {
    Offered,
    Accepted,
    Active,
    Paused,
    Completed,
    Failed,
    Cancelled,
    Rejected
};

const char* transferStatusName(TransferStatus status);
// Throws ValidationError on unknown names
TransferStatus transferStatusFromName(const std::string& name);
bool isTerminal(TransferStatus status);

/**
 * Transfer record as kept in the coordination store under
 * rendezvous:transfer:{id}. Timestamps are epoch milliseconds.
 */
struct FileTransfer {
    std::string transfer_id;
    std::string room_id;
    std::string sender_id;
    std::string receiver_id;
    std::string filename;
    int64_t size_bytes = 0;
    std::string mime_type;
    int64_t chunk_size = 0;
    int64_t total_chunks = 0;
    int64_t chunks_acked = 0;
    TransferStatus status = TransferStatus::Offered;
    std::string checksum_expected;
    std::string checksum_actual;
    std::string error;
    std::string storage_path;
    int64_t created_at = 0;
    int64_t last_activity_at = 0;
    int64_t completed_at = 0;

    bool involves(const std::string& user_id) const {
        return user_id == sender_id || user_id == receiver_id;
    }

    // Expected byte length of chunk index
    int64_t chunkLength(int64_t index) const;

    std::string toJson() const;
    // Throws std::invalid_argument on malformed records
    static FileTransfer fromJson(const std::string& json);

    // Client-facing representation with ISO-8601 timestamps and percent
    std::string toViewJson() const;
};

struct TransferProgress {
    double percent = 0.0;
    int64_t chunks_acked = 0;
    int64_t total_chunks = 0;
    TransferStatus status = TransferStatus::Offered;

    std::string toJson(const std::string& transfer_id) const;
};

struct ChunkReceipt {
    bool accepted_new = false;   // false for a duplicate
    TransferProgress progress;
};

} // namespace rendezvous

#endif // FILE_TRANSFER_HPP
