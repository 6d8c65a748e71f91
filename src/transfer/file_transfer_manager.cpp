#include "../../include/transfer/file_transfer_manager.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/crypto/digest.hpp"
#include "../../include/signaling/room_registry.hpp"
#include "../../include/store/store_keys.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>

namespace rendezvous {

namespace {

const int kMaxCasAttempts = 16;
const size_t kMaxFilenameBytes = 255;
const int kMaxIdAttempts = 4;
const int kFinalizeLockSeconds = 60;

std::string toLower(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Lower-case extension with its dot, or empty
std::string extensionOf(const std::string& filename) {
    const size_t dot = filename.find_last_of('.');
    const size_t slash = filename.find_last_of("/\\");
    if (dot == std::string::npos || dot == 0 || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    return toLower(filename.substr(dot));
}

bool isSha256Hex(const std::string& value) {
    if (value.size() != 64) return false;
    return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

FileTransfer parseRecord(const std::string& raw) {
    try {
        return FileTransfer::fromJson(raw);
    } catch (const std::invalid_argument& e) {
        throw RendezvousError(ErrorCode::INTERNAL_ERROR, std::string("Corrupt transfer record: ") + e.what());
    }
}

std::string statusPayload(const FileTransfer& transfer, const std::string& extra_key = "",
                          const std::string& extra_value = "") {
    std::ostringstream oss;
    oss << "{"
        << "\"transfer_id\":" << JsonParser::quote(transfer.transfer_id) << ","
        << "\"status\":\"" << transferStatusName(transfer.status) << "\","
        << "\"chunks_acked\":" << transfer.chunks_acked << ","
        << "\"total_chunks\":" << transfer.total_chunks;
    if (!extra_key.empty()) {
        oss << "," << JsonParser::quote(extra_key) << ":" << JsonParser::quote(extra_value);
    }
    oss << "}";
    return oss.str();
}

std::string completionPayload(const FileTransfer& transfer, const std::string& error_code,
                              const std::string& error_message) {
    std::ostringstream oss;
    oss << "{"
        << "\"transfer_id\":" << JsonParser::quote(transfer.transfer_id) << ","
        << "\"status\":\"" << transferStatusName(transfer.status) << "\","
        << "\"success\":" << (transfer.status == TransferStatus::Completed ? "true" : "false") << ","
        << "\"checksum\":" << JsonParser::quote(transfer.checksum_actual);
    if (!error_code.empty()) {
        oss << ",\"error\":{\"code\":" << JsonParser::quote(error_code)
            << ",\"message\":" << JsonParser::quote(error_message) << "}";
    }
    oss << "}";
    return oss.str();
}

TransferProgress progressOf(const FileTransfer& transfer) {
    TransferProgress progress;
    progress.chunks_acked = transfer.chunks_acked;
    progress.total_chunks = transfer.total_chunks;
    progress.status = transfer.status;
    progress.percent = transfer.total_chunks > 0
        ? 100.0 * static_cast<double>(transfer.chunks_acked) / static_cast<double>(transfer.total_chunks)
        : 0.0;
    return progress;
}

} // namespace

FileTransferManager::FileTransferManager(std::shared_ptr<CoordinationStore> store,
                                         std::shared_ptr<SignalingRelay> relay,
                                         std::shared_ptr<ChunkStorage> storage,
                                         const TransferSettings& settings,
                                         Clock clock)
    : store_(std::move(store))
    , relay_(std::move(relay))
    , storage_(std::move(storage))
    , settings_(settings)
    , clock_(std::move(clock)) {
}

int FileTransferManager::recordTtlSeconds() const {
    return settings_.timeout_seconds * 2;
}

std::optional<FileTransfer> FileTransferManager::tryLoad(const std::string& transfer_id) {
    std::optional<std::string> raw = store_->get(keys::transfer(transfer_id));
    if (!raw) {
        return std::nullopt;
    }
    return parseRecord(*raw);
}

FileTransfer FileTransferManager::load(const std::string& transfer_id) {
    std::optional<FileTransfer> transfer = tryLoad(transfer_id);
    if (!transfer) {
        throw NotFoundError("Transfer " + transfer_id + " not found");
    }
    return *transfer;
}

FileTransfer FileTransferManager::mutate(const std::string& transfer_id, const Mutation& mutation, bool* changed) {
    const std::string key = keys::transfer(transfer_id);
    for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
        std::optional<std::string> raw = store_->get(key);
        if (!raw) {
            throw NotFoundError("Transfer " + transfer_id + " not found");
        }
        const FileTransfer before = parseRecord(*raw);
        FileTransfer after = before;
        if (!mutation(after)) {
            if (changed) *changed = false;
            return before;
        }
        after.last_activity_at = clock_();
        if (store_->compareAndSwap(key, *raw, after.toJson(), recordTtlSeconds())) {
            if (changed) *changed = true;
            if (!isTerminal(before.status) && isTerminal(after.status)) {
                releaseSlot(after.sender_id);
            }
            return after;
        }
    }
    throw CoordinationStoreError("Transfer " + transfer_id + " is under heavy contention");
}

void FileTransferManager::releaseSlot(const std::string& sender_id) {
    const std::string key = keys::activeTransfers(sender_id);
    int64_t remaining = store_->decr(key);
    if (remaining < 0) {
        Logger::getInstance().warning("Active transfer counter of " + sender_id + " went negative, correcting");
        store_->incr(key);
    }
}

int64_t FileTransferManager::activeTransferCount(const std::string& sender_id) {
    std::optional<std::string> raw = store_->get(keys::activeTransfers(sender_id));
    if (!raw) {
        return 0;
    }
    try {
        return std::max<int64_t>(0, std::stoll(*raw));
    } catch (const std::exception&) {
        return 0;
    }
}

void FileTransferManager::notify(const FileTransfer& transfer, MessageType type, const std::string& payload,
                                 const std::string& actor_id, bool both_parties) {
    std::vector<std::string> targets;
    if (both_parties) {
        targets = {transfer.sender_id, transfer.receiver_id};
    } else {
        targets = {actor_id == transfer.sender_id ? transfer.receiver_id : transfer.sender_id};
    }

    for (const auto& target : targets) {
        SignalingMessage message;
        message.type = type;
        message.room_id = transfer.room_id;
        message.sender_id = actor_id;
        message.target_user_id = target;
        message.payload = payload;
        try {
            relay_->publish(message);
        } catch (const RendezvousError& e) {
            Logger::getInstance().warning("Failed to notify " + target + " about transfer " +
                                          transfer.transfer_id + ": " + e.what());
        }
    }
}

FileTransfer FileTransferManager::offer(const TransferOffer& request) {
    RoomRegistry::validateRoomId(request.room_id);
    if (request.sender_id.empty() || request.receiver_id.empty()) {
        throw ValidationError("Transfer needs both a sender and a receiver");
    }
    if (request.sender_id == request.receiver_id) {
        throw ValidationError("Cannot offer a transfer to yourself");
    }
    if (request.filename.empty() || request.filename.size() > kMaxFilenameBytes) {
        throw ValidationError("Filename must be 1-255 bytes");
    }
    if (request.size_bytes <= 0) {
        throw ValidationError("File size must be positive");
    }
    const std::string extension = extensionOf(request.filename);
    if (!extension.empty() && std::find(settings_.blocked_extensions.begin(), settings_.blocked_extensions.end(),
                                        extension) != settings_.blocked_extensions.end()) {
        Logger::getInstance().warning("Blocked offer of " + request.filename + " by " + request.sender_id);
        throw ValidationError("File type not allowed: " + extension);
    }
    if (!request.checksum_expected.empty() && !isSha256Hex(request.checksum_expected)) {
        throw ValidationError("Checksum must be a hex SHA-256 digest");
    }
    if (request.size_bytes > settings_.max_file_size) {
        throw CapacityError(ErrorCode::FILE_TOO_LARGE,
                            "File exceeds the maximum size of " + std::to_string(settings_.max_file_size) + " bytes");
    }

    // Claim a concurrency slot before anything is written
    const std::string slot_key = keys::activeTransfers(request.sender_id);
    if (store_->incr(slot_key) > settings_.max_concurrent) {
        store_->decr(slot_key);
        Logger::getInstance().warning("Transfer limit reached for " + request.sender_id);
        throw CapacityError(ErrorCode::TRANSFER_LIMIT_REACHED,
                            "Sender already has " + std::to_string(settings_.max_concurrent) +
                            " transfers in progress");
    }

    FileTransfer transfer;
    transfer.room_id = request.room_id;
    transfer.sender_id = request.sender_id;
    transfer.receiver_id = request.receiver_id;
    transfer.filename = request.filename;
    transfer.size_bytes = request.size_bytes;
    transfer.mime_type = request.mime_type.empty() ? "application/octet-stream" : request.mime_type;
    transfer.chunk_size = settings_.chunk_size;
    transfer.total_chunks = (request.size_bytes + settings_.chunk_size - 1) / settings_.chunk_size;
    transfer.status = TransferStatus::Offered;
    transfer.checksum_expected = toLower(request.checksum_expected);
    transfer.created_at = clock_();
    transfer.last_activity_at = transfer.created_at;

    try {
        bool created = false;
        for (int attempt = 0; attempt < kMaxIdAttempts && !created; ++attempt) {
            transfer.transfer_id = crypto::randomHex(16);
            created = store_->compareAndSwap(keys::transfer(transfer.transfer_id), "", transfer.toJson(),
                                             recordTtlSeconds());
        }
        if (!created) {
            throw RendezvousError(ErrorCode::INTERNAL_ERROR, "Could not allocate a transfer id");
        }
    } catch (...) {
        releaseSlot(request.sender_id);
        throw;
    }

    for (const auto& user_id : {transfer.sender_id, transfer.receiver_id}) {
        store_->sadd(keys::userTransfers(user_id), transfer.transfer_id);
        store_->expire(keys::userTransfers(user_id), recordTtlSeconds());
    }
    store_->sadd(keys::transferIndex(), transfer.transfer_id);

    Logger::getInstance().info("Transfer " + transfer.transfer_id + " offered by " + transfer.sender_id + " to " +
                               transfer.receiver_id + " (" + std::to_string(transfer.size_bytes) + " bytes, " +
                               std::to_string(transfer.total_chunks) + " chunks)");

    notify(transfer, MessageType::FileTransferOffer, transfer.toViewJson(), transfer.sender_id, false);
    return transfer;
}

FileTransfer FileTransferManager::accept(const std::string& transfer_id, const std::string& user_id) {
    FileTransfer current = load(transfer_id);
    if (user_id != current.receiver_id) {
        throw PermissionError("Only the receiver can accept a transfer");
    }

    bool changed = false;
    FileTransfer transfer = mutate(transfer_id, [](FileTransfer& t) {
        switch (t.status) {
            case TransferStatus::Offered:
                t.status = TransferStatus::Accepted;
                return true;
            case TransferStatus::Accepted:
            case TransferStatus::Active:
            case TransferStatus::Paused:
                return false;
            case TransferStatus::Completed:
            case TransferStatus::Failed:
            case TransferStatus::Cancelled:
            case TransferStatus::Rejected:
                break;
        }
        throw StateError(std::string("Cannot accept a transfer that is ") + transferStatusName(t.status));
    }, &changed);

    if (changed) {
        Logger::getInstance().info("Transfer " + transfer_id + " accepted by " + user_id);
        notify(transfer, MessageType::FileTransferAccept, statusPayload(transfer), user_id, false);
    }
    return transfer;
}

FileTransfer FileTransferManager::reject(const std::string& transfer_id, const std::string& user_id,
                                         const std::string& reason) {
    FileTransfer current = load(transfer_id);
    if (user_id != current.receiver_id) {
        throw PermissionError("Only the receiver can reject a transfer");
    }

    bool changed = false;
    FileTransfer transfer = mutate(transfer_id, [&reason](FileTransfer& t) {
        if (t.status == TransferStatus::Rejected) {
            return false;
        }
        if (t.status != TransferStatus::Offered) {
            throw StateError(std::string("Cannot reject a transfer that is ") + transferStatusName(t.status));
        }
        t.status = TransferStatus::Rejected;
        t.error = reason.empty() ? "rejected" : reason;
        return true;
    }, &changed);

    if (changed) {
        Logger::getInstance().info("Transfer " + transfer_id + " rejected by " + user_id);
        storage_->release(transfer_id);
        notify(transfer, MessageType::FileTransferReject, statusPayload(transfer, "reason", transfer.error),
               user_id, false);
    }
    return transfer;
}

ChunkReceipt FileTransferManager::submitChunk(const std::string& transfer_id, const std::string& user_id,
                                              int64_t index, const std::string& data,
                                              const std::string& checksum_partial) {
    FileTransfer current = load(transfer_id);
    if (user_id != current.sender_id) {
        throw PermissionError("Only the sender can submit chunks");
    }
    if (current.status == TransferStatus::Paused) {
        throw StateError("Transfer is paused");
    }
    if (current.status != TransferStatus::Accepted && current.status != TransferStatus::Active) {
        throw StateError(std::string("Cannot submit chunks while the transfer is ") +
                         transferStatusName(current.status));
    }
    if (index < 0 || index >= current.total_chunks) {
        throw ValidationError("Chunk index " + std::to_string(index) + " is out of range [0, " +
                              std::to_string(current.total_chunks) + ")");
    }

    const std::string chunks_key = keys::transferChunks(transfer_id);
    ChunkReceipt receipt;

    if (!store_->sismember(chunks_key, std::to_string(index))) {
        if (static_cast<int64_t>(data.size()) != current.chunkLength(index)) {
            throw ValidationError("Chunk " + std::to_string(index) + " must be " +
                                  std::to_string(current.chunkLength(index)) + " bytes, got " +
                                  std::to_string(data.size()));
        }
        if (checksum_partial.empty()) {
            throw ValidationError("Chunk checksum is required");
        }
        if (!crypto::constantTimeEquals(crypto::sha256Hex(data), toLower(checksum_partial))) {
            throw ValidationError("Checksum mismatch for chunk " + std::to_string(index));
        }

        try {
            storage_->writeChunk(transfer_id, index, data);
        } catch (const std::runtime_error& e) {
            Logger::getInstance().error("Chunk storage failed for " + transfer_id + ": " + e.what());
            throw RendezvousError(ErrorCode::INTERNAL_ERROR, "Failed to store chunk");
        }

        receipt.accepted_new = store_->sadd(chunks_key, std::to_string(index));
        store_->expire(chunks_key, recordTtlSeconds());
    }

    // The chunk set is the source of truth. Folding it into the record on
    // every submission, duplicates included, lets a retry finish the work of
    // an attempt that failed after its SADD.
    const int64_t acked = std::min(store_->scard(chunks_key), current.total_chunks);
    const std::string assembled_path = storage_->assembledPath(transfer_id);
    int64_t acked_before = 0;
    FileTransfer transfer = mutate(transfer_id, [acked, &assembled_path, &acked_before](FileTransfer& t) {
        if (isTerminal(t.status)) {
            throw StateError(std::string("Transfer is already ") + transferStatusName(t.status));
        }
        acked_before = t.chunks_acked;
        if (t.status != TransferStatus::Accepted && t.chunks_acked >= acked && t.storage_path == assembled_path) {
            return false;
        }
        if (t.status == TransferStatus::Accepted) {
            t.status = TransferStatus::Active;
        }
        t.chunks_acked = std::max(t.chunks_acked, acked);
        t.storage_path = assembled_path;
        return true;
    });

    // Progress goes to the receiver in 10% steps
    const int64_t step_before = acked_before * 10 / transfer.total_chunks;
    const int64_t step_after = transfer.chunks_acked * 10 / transfer.total_chunks;
    if (step_after > step_before && transfer.chunks_acked < transfer.total_chunks) {
        notify(transfer, MessageType::FileTransferProgress, progressOf(transfer).toJson(transfer_id),
               user_id, false);
    }

    if (transfer.chunks_acked >= transfer.total_chunks && transfer.status == TransferStatus::Active) {
        complete(transfer_id);
        transfer = load(transfer_id);
    }

    receipt.progress = progressOf(transfer);
    return receipt;
}

namespace {

// Held while one instance assembles and verifies a finished transfer
class FinalizeLock {
public:
    FinalizeLock(CoordinationStore& store, std::string key)
        : store_(store), key_(std::move(key)) {
        acquired_ = store_.compareAndSwap(key_, "", "1", kFinalizeLockSeconds);
    }

    ~FinalizeLock() {
        if (!acquired_) return;
        try {
            store_.del(key_);
        } catch (const CoordinationStoreError& e) {
            Logger::getInstance().warning("Could not release " + key_ + ", it expires in " +
                                          std::to_string(kFinalizeLockSeconds) + "s: " + e.what());
        }
    }

    FinalizeLock(const FinalizeLock&) = delete;
    FinalizeLock& operator=(const FinalizeLock&) = delete;

    bool acquired() const { return acquired_; }

private:
    CoordinationStore& store_;
    std::string key_;
    bool acquired_ = false;
};

} // namespace

void FileTransferManager::complete(const std::string& transfer_id) {
    FinalizeLock lock(*store_, keys::transferFinalizeLock(transfer_id));
    if (!lock.acquired()) {
        return;
    }

    FileTransfer current = load(transfer_id);
    if (current.status != TransferStatus::Active || current.chunks_acked < current.total_chunks) {
        return;
    }

    std::string actual;
    std::string assembly_error;
    try {
        actual = storage_->assemble(transfer_id, current.total_chunks);
    } catch (const std::runtime_error& e) {
        assembly_error = e.what();
        Logger::getInstance().error("Assembly of transfer " + transfer_id + " failed: " + assembly_error);
    }

    const bool verified = assembly_error.empty() &&
                          (current.checksum_expected.empty() ||
                           crypto::constantTimeEquals(current.checksum_expected, actual));
    const int64_t now = clock_();
    const std::string assembled_path = storage_->assembledPath(transfer_id);

    bool changed = false;
    FileTransfer transfer = mutate(transfer_id, [&](FileTransfer& t) {
        if (isTerminal(t.status)) {
            return false;
        }
        t.checksum_actual = actual;
        t.completed_at = now;
        if (verified) {
            t.status = TransferStatus::Completed;
            t.storage_path = assembled_path;
        } else {
            t.status = TransferStatus::Failed;
            t.error = assembly_error.empty() ? errorCodeName(ErrorCode::CHECKSUM_MISMATCH) : "assembly_failed";
            t.storage_path.clear();
        }
        return true;
    }, &changed);

    if (!changed) {
        return;
    }

    if (verified) {
        Logger::getInstance().info("Transfer " + transfer_id + " completed, sha256 " + actual);
        notify(transfer, MessageType::FileTransferComplete, completionPayload(transfer, "", ""), "", true);
        return;
    }

    storage_->release(transfer_id);
    if (!assembly_error.empty()) {
        notify(transfer, MessageType::FileTransferComplete,
               completionPayload(transfer, errorCodeName(ErrorCode::INTERNAL_ERROR), "Assembly failed"), "", true);
        throw RendezvousError(ErrorCode::INTERNAL_ERROR, "Failed to assemble transfer " + transfer_id);
    }

    const std::string message = "Assembled file checksum " + actual + " does not match declared " +
                                current.checksum_expected;
    Logger::getInstance().warning("Transfer " + transfer_id + " failed integrity check: " + message);
    notify(transfer, MessageType::FileTransferComplete,
           completionPayload(transfer, errorCodeName(ErrorCode::CHECKSUM_MISMATCH), message), "", true);
    throw IntegrityError(message);
}

FileTransfer FileTransferManager::pause(const std::string& transfer_id, const std::string& user_id) {
    FileTransfer current = load(transfer_id);
    if (!current.involves(user_id)) {
        throw PermissionError("Only the sender or receiver can pause a transfer");
    }

    bool changed = false;
    FileTransfer transfer = mutate(transfer_id, [](FileTransfer& t) {
        if (t.status == TransferStatus::Paused) {
            return false;
        }
        if (t.status != TransferStatus::Active) {
            throw StateError(std::string("Cannot pause a transfer that is ") + transferStatusName(t.status));
        }
        t.status = TransferStatus::Paused;
        return true;
    }, &changed);

    if (changed) {
        Logger::getInstance().info("Transfer " + transfer_id + " paused by " + user_id);
        notify(transfer, MessageType::FileTransferProgress, progressOf(transfer).toJson(transfer_id), user_id, true);
    }
    return transfer;
}

FileTransfer FileTransferManager::resume(const std::string& transfer_id, const std::string& user_id) {
    FileTransfer current = load(transfer_id);
    if (!current.involves(user_id)) {
        throw PermissionError("Only the sender or receiver can resume a transfer");
    }

    bool changed = false;
    FileTransfer transfer = mutate(transfer_id, [](FileTransfer& t) {
        if (t.status == TransferStatus::Active) {
            return false;
        }
        if (t.status != TransferStatus::Paused) {
            throw StateError(std::string("Cannot resume a transfer that is ") + transferStatusName(t.status));
        }
        t.status = TransferStatus::Active;
        return true;
    }, &changed);

    if (changed) {
        Logger::getInstance().info("Transfer " + transfer_id + " resumed by " + user_id);
        notify(transfer, MessageType::FileTransferProgress, progressOf(transfer).toJson(transfer_id), user_id, true);
        // The last chunk may have landed just before a pause
        if (transfer.chunks_acked >= transfer.total_chunks) {
            complete(transfer_id);
            transfer = load(transfer_id);
        }
    }
    return transfer;
}

FileTransfer FileTransferManager::cancel(const std::string& transfer_id, const std::string& user_id) {
    FileTransfer current = load(transfer_id);
    if (!current.involves(user_id)) {
        throw PermissionError("Only the sender or receiver can cancel a transfer");
    }

    bool changed = false;
    FileTransfer transfer = mutate(transfer_id, [](FileTransfer& t) {
        if (t.status == TransferStatus::Cancelled) {
            return false;
        }
        if (isTerminal(t.status)) {
            throw StateError(std::string("Cannot cancel a transfer that is ") + transferStatusName(t.status));
        }
        t.status = TransferStatus::Cancelled;
        t.storage_path.clear();
        return true;
    }, &changed);

    if (changed) {
        storage_->release(transfer_id);
        Logger::getInstance().info("Transfer " + transfer_id + " cancelled by " + user_id);
        notify(transfer, MessageType::FileTransferProgress, progressOf(transfer).toJson(transfer_id), user_id, true);
    }
    return transfer;
}

TransferProgress FileTransferManager::progress(const std::string& transfer_id, const std::string& user_id) {
    return progressOf(get(transfer_id, user_id));
}

FileTransfer FileTransferManager::get(const std::string& transfer_id, const std::string& user_id) {
    FileTransfer transfer = load(transfer_id);
    if (!transfer.involves(user_id)) {
        throw PermissionError("Transfer belongs to other users");
    }
    return transfer;
}

std::vector<FileTransfer> FileTransferManager::listForUser(const std::string& user_id,
                                                           std::optional<TransferStatus> status) {
    std::vector<FileTransfer> result;
    const std::string index_key = keys::userTransfers(user_id);
    for (const auto& transfer_id : store_->smembers(index_key)) {
        std::optional<FileTransfer> transfer = tryLoad(transfer_id);
        if (!transfer) {
            store_->srem(index_key, transfer_id);
            continue;
        }
        if (status && transfer->status != *status) {
            continue;
        }
        result.push_back(*transfer);
    }
    std::sort(result.begin(), result.end(), [](const FileTransfer& a, const FileTransfer& b) {
        return a.created_at > b.created_at;
    });
    return result;
}

std::map<std::string, int64_t> FileTransferManager::countByStatus() {
    std::map<std::string, int64_t> counts;
    for (const auto& transfer_id : store_->smembers(keys::transferIndex())) {
        std::optional<FileTransfer> transfer;
        try {
            transfer = tryLoad(transfer_id);
        } catch (const RendezvousError& e) {
            Logger::getInstance().debug("Not counting " + transfer_id + ": " + e.what());
            continue;
        }
        if (transfer) {
            counts[transferStatusName(transfer->status)]++;
        }
    }
    return counts;
}

size_t FileTransferManager::reapInactive() {
    const int64_t now = clock_();
    const int64_t timeout_ms = static_cast<int64_t>(settings_.timeout_seconds) * 1000;
    size_t reaped = 0;

    for (const auto& transfer_id : store_->smembers(keys::transferIndex())) {
        std::optional<FileTransfer> current;
        try {
            current = tryLoad(transfer_id);
        } catch (const RendezvousError& e) {
            Logger::getInstance().warning("Reaper skipping " + transfer_id + ": " + e.what());
            continue;
        }

        if (!current) {
            // Record expired; nothing left but storage
            store_->srem(keys::transferIndex(), transfer_id);
            storage_->release(transfer_id);
            continue;
        }

        if (isTerminal(current->status)) {
            const int64_t finished = std::max(current->completed_at, current->last_activity_at);
            if (now - finished > timeout_ms && storage_->exists(transfer_id)) {
                storage_->release(transfer_id);
                Logger::getInstance().info("Removed stored data of finished transfer " + transfer_id);
            }
            continue;
        }

        if (now - current->last_activity_at <= timeout_ms) {
            continue;
        }

        bool changed = false;
        FileTransfer transfer = mutate(transfer_id, [now, timeout_ms](FileTransfer& t) {
            if (isTerminal(t.status) || now - t.last_activity_at <= timeout_ms) {
                return false;
            }
            t.status = TransferStatus::Failed;
            t.error = "timeout";
            t.completed_at = now;
            t.storage_path.clear();
            return true;
        }, &changed);

        if (changed) {
            reaped++;
            storage_->release(transfer_id);
            Logger::getInstance().warning("Transfer " + transfer_id + " timed out after inactivity");
            notify(transfer, MessageType::FileTransferComplete,
                   completionPayload(transfer, "timeout", "Transfer inactive for too long"), "", true);
        }
    }

    // Storage left behind by transfers this store no longer knows about
    for (const auto& transfer_id : storage_->storedTransfers()) {
        if (!store_->exists(keys::transfer(transfer_id))) {
            storage_->release(transfer_id);
        }
    }
    return reaped;
}

} // namespace rendezvous
