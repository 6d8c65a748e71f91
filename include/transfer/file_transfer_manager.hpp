#ifndef FILE_TRANSFER_MANAGER_HPP
#define FILE_TRANSFER_MANAGER_HPP

#include "file_transfer.hpp"
#include "chunk_storage.hpp"
#include "../signaling/signaling_relay.hpp"
#include "../store/coordination_store.hpp"
#include "../utils/config.hpp"
#include "../utils/time_utils.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rendezvous {

struct TransferOffer {
    std::string room_id;
    std::string sender_id;
    std::string receiver_id;
    std::string filename;
    int64_t size_bytes = 0;
    std::string mime_type;
    std::string checksum_expected;  // optional hex SHA-256 of the whole file
};

/**
 * Chunked, resumable file transfer lifecycle.
 *
 *   Offered -> Accepted -> Active <-> Paused -> Completed | Failed | Cancelled
 *   Offered -> Rejected
 *
 * Records live in the coordination store and are only changed through a
 * compare-and-swap loop, so any instance can serve either party. Acked
 * chunk indices are a store set; SADD decides whether an index is new.
 * Lifecycle changes are relayed to the parties through the signaling relay.
 */
class FileTransferManager {
public:
    FileTransferManager(std::shared_ptr<CoordinationStore> store,
                        std::shared_ptr<SignalingRelay> relay,
                        std::shared_ptr<ChunkStorage> storage,
                        const TransferSettings& settings,
                        Clock clock = systemClock());

    /**
     * Create a transfer in Offered state and notify the receiver.
     * Throws ValidationError, CapacityError(file_too_large | transfer_limit_reached).
     */
    FileTransfer offer(const TransferOffer& request);

    FileTransfer accept(const std::string& transfer_id, const std::string& user_id);
    FileTransfer reject(const std::string& transfer_id, const std::string& user_id, const std::string& reason);

    /**
     * Store one chunk. Re-submitting an acked index is a no-op success.
     * Completes the transfer once every chunk is acked; throws IntegrityError
     * if the assembled file does not match the declared checksum.
     */
    ChunkReceipt submitChunk(const std::string& transfer_id, const std::string& user_id,
                             int64_t index, const std::string& data, const std::string& checksum_partial);

    FileTransfer pause(const std::string& transfer_id, const std::string& user_id);
    FileTransfer resume(const std::string& transfer_id, const std::string& user_id);
    FileTransfer cancel(const std::string& transfer_id, const std::string& user_id);

    TransferProgress progress(const std::string& transfer_id, const std::string& user_id);
    FileTransfer get(const std::string& transfer_id, const std::string& user_id);
    std::vector<FileTransfer> listForUser(const std::string& user_id,
                                          std::optional<TransferStatus> status = std::nullopt);

    /**
     * Fail transfers idle beyond the timeout, freeing their slots and
     * storage, and drop stored files of terminal transfers older than the
     * timeout.
     * @return number of transfers moved to Failed
     */
    size_t reapInactive();

    int64_t activeTransferCount(const std::string& sender_id);

    // Tracked transfers keyed by status name
    std::map<std::string, int64_t> countByStatus();

private:
    // Returns false to leave the record unchanged (idempotent no-op)
    using Mutation = std::function<bool(FileTransfer& transfer)>;

    FileTransfer load(const std::string& transfer_id);
    std::optional<FileTransfer> tryLoad(const std::string& transfer_id);
    FileTransfer mutate(const std::string& transfer_id, const Mutation& mutation, bool* changed = nullptr);

    void complete(const std::string& transfer_id);
    void releaseSlot(const std::string& sender_id);
    int recordTtlSeconds() const;

    void notify(const FileTransfer& transfer, MessageType type, const std::string& payload,
                const std::string& actor_id, bool both_parties);

    std::shared_ptr<CoordinationStore> store_;
    std::shared_ptr<SignalingRelay> relay_;
    std::shared_ptr<ChunkStorage> storage_;
    TransferSettings settings_;
    Clock clock_;
};

} // namespace rendezvous

#endif // FILE_TRANSFER_MANAGER_HPP
