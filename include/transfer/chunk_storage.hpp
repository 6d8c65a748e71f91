#ifndef CHUNK_STORAGE_HPP
#define CHUNK_STORAGE_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace rendezvous {

/**
 * Temporary on-disk storage for transfer chunks.
 *
 * Layout: {root}/{transfer_id}/chunk_000042 while chunks arrive, then
 * {root}/{transfer_id}/assembled once every chunk is present. Nothing
 * here is durable; completed files are kept only until the reaper
 * removes them.
 */
class ChunkStorage {
public:
    explicit ChunkStorage(const std::string& root);

    // Throws std::runtime_error on I/O failure
    void writeChunk(const std::string& transfer_id, int64_t index, const std::string& data);
    bool hasChunk(const std::string& transfer_id, int64_t index) const;

    /**
     * Concatenate chunks 0..total_chunks-1 into the assembled file and drop
     * the chunk files.
     * @return hex SHA-256 of the assembled file
     */
    std::string assemble(const std::string& transfer_id, int64_t total_chunks);

    std::string assembledPath(const std::string& transfer_id) const;
    bool exists(const std::string& transfer_id) const;

    // Remove everything stored for a transfer
    void release(const std::string& transfer_id);

    std::vector<std::string> storedTransfers() const;
    const std::string& root() const { return root_; }

private:
    std::string transferDir(const std::string& transfer_id) const;
    std::string chunkPath(const std::string& transfer_id, int64_t index) const;

    std::string root_;
};

} // namespace rendezvous

#endif // CHUNK_STORAGE_HPP
