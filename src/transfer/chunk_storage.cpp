#include "../../include/transfer/chunk_storage.hpp"
#include "../../include/crypto/digest.hpp"
#include "../../include/utils/logger.hpp"
#include <boost/filesystem.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace fs = boost::filesystem;

namespace rendezvous {

namespace {

const size_t kCopyBufferSize = 64 * 1024;

void requireSafeId(const std::string& transfer_id) {
    if (transfer_id.empty() || transfer_id.find('/') != std::string::npos ||
        transfer_id.find('\\') != std::string::npos || transfer_id == "." || transfer_id == "..") {
        throw std::invalid_argument("Unsafe transfer id for storage: " + transfer_id);
    }
}

} // namespace

ChunkStorage::ChunkStorage(const std::string& root)
    : root_(root) {
    try {
        fs::path dir_path(root_);
        if (!fs::exists(dir_path)) {
            fs::create_directories(dir_path);
        }
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error("Failed to create transfer directory " + root_ + ": " + e.what());
    }
}

std::string ChunkStorage::transferDir(const std::string& transfer_id) const {
    requireSafeId(transfer_id);
    return (fs::path(root_) / transfer_id).string();
}

std::string ChunkStorage::chunkPath(const std::string& transfer_id, int64_t index) const {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%06lld", static_cast<long long>(index));
    return (fs::path(transferDir(transfer_id)) / name).string();
}

std::string ChunkStorage::assembledPath(const std::string& transfer_id) const {
    return (fs::path(transferDir(transfer_id)) / "assembled").string();
}

void ChunkStorage::writeChunk(const std::string& transfer_id, int64_t index, const std::string& data) {
    fs::path dir_path(transferDir(transfer_id));
    try {
        if (!fs::exists(dir_path)) {
            fs::create_directories(dir_path);
        }
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error("Failed to create " + dir_path.string() + ": " + e.what());
    }

    // Write to a temp name and rename so a reader never sees a partial chunk
    const std::string final_path = chunkPath(transfer_id, index);
    const std::string temp_path = final_path + ".part";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open chunk file for writing: " + temp_path);
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!file) {
            throw std::runtime_error("Failed to write chunk file: " + temp_path);
        }
    }

    boost::system::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec) {
        throw std::runtime_error("Failed to store chunk " + std::to_string(index) + ": " + ec.message());
    }
}

bool ChunkStorage::hasChunk(const std::string& transfer_id, int64_t index) const {
    boost::system::error_code ec;
    return fs::is_regular_file(chunkPath(transfer_id, index), ec);
}

std::string ChunkStorage::assemble(const std::string& transfer_id, int64_t total_chunks) {
    const std::string output_path = assembledPath(transfer_id);
    crypto::Sha256Stream digest;
    std::vector<char> buffer(kCopyBufferSize);

    {
        std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw std::runtime_error("Failed to open assembled file: " + output_path);
        }

        for (int64_t index = 0; index < total_chunks; ++index) {
            const std::string path = chunkPath(transfer_id, index);
            std::ifstream input(path, std::ios::binary);
            if (!input.is_open()) {
                throw std::runtime_error("Missing chunk " + std::to_string(index) + " for transfer " + transfer_id);
            }
            while (input) {
                input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = input.gcount();
                if (got <= 0) break;
                output.write(buffer.data(), got);
                digest.update(buffer.data(), static_cast<size_t>(got));
            }
        }
        if (!output) {
            throw std::runtime_error("Failed to write assembled file: " + output_path);
        }
    }

    for (int64_t index = 0; index < total_chunks; ++index) {
        boost::system::error_code ec;
        fs::remove(chunkPath(transfer_id, index), ec);
        if (ec) {
            Logger::getInstance().warning("Could not remove chunk " + std::to_string(index) + " of " +
                                          transfer_id + ": " + ec.message());
        }
    }

    return digest.finalHex();
}

bool ChunkStorage::exists(const std::string& transfer_id) const {
    boost::system::error_code ec;
    return fs::exists(transferDir(transfer_id), ec);
}

void ChunkStorage::release(const std::string& transfer_id) {
    boost::system::error_code ec;
    fs::remove_all(transferDir(transfer_id), ec);
    if (ec) {
        Logger::getInstance().warning("Failed to release storage for transfer " + transfer_id + ": " + ec.message());
    }
}

std::vector<std::string> ChunkStorage::storedTransfers() const {
    std::vector<std::string> ids;
    boost::system::error_code ec;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (fs::is_directory(it->status())) {
            ids.push_back(it->path().filename().string());
        }
    }
    return ids;
}

} // namespace rendezvous
