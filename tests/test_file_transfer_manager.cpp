#include <catch2/catch.hpp>
#include "crypto/digest.hpp"
#include "store/store_keys.hpp"
#include "store/in_memory_coordination_store.hpp"
#include "transfer/file_transfer_manager.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <fstream>
#include <numeric>
#include <random>
#include <sstream>

using namespace rendezvous;
using rendezvous::test::SignalingHarness;
using rendezvous::test::TempDir;
using rendezvous::test::errorCodeOf;
using rendezvous::test::patternBytes;

namespace {

struct TransferFixture {
    explicit TransferFixture(TransferSettings transfer = smallChunks()) {
        settings = transfer;
        settings.storage_dir = dir.path();
        storage = std::make_shared<ChunkStorage>(settings.storage_dir);
        manager = std::make_shared<FileTransferManager>(h.store, h.relay, storage, settings, h.clock.clock());
    }

    static TransferSettings smallChunks() {
        TransferSettings s;
        s.chunk_size = 1024;
        s.max_file_size = 1024 * 1024;
        return s;
    }

    FileTransfer offer(const std::string& data, const std::string& checksum, const std::string& filename = "notes.txt") {
        TransferOffer request;
        request.room_id = "room-1";
        request.sender_id = "alice";
        request.receiver_id = "bob";
        request.filename = filename;
        request.size_bytes = static_cast<int64_t>(data.size());
        request.mime_type = "text/plain";
        request.checksum_expected = checksum;
        return manager->offer(request);
    }

    ChunkReceipt send(const FileTransfer& transfer, const std::string& data, int64_t index) {
        const std::string chunk = data.substr(static_cast<size_t>(index * transfer.chunk_size),
                                              static_cast<size_t>(transfer.chunkLength(index)));
        return manager->submitChunk(transfer.transfer_id, "alice", index, chunk, crypto::sha256Hex(chunk));
    }

    SignalingHarness h;
    TempDir dir;
    TransferSettings settings;
    std::shared_ptr<ChunkStorage> storage;
    std::shared_ptr<FileTransferManager> manager;
};

// Fails chosen store calls once, the way a dropped redis connection would
class FlakyStore : public InMemoryCoordinationStore {
public:
    using InMemoryCoordinationStore::InMemoryCoordinationStore;

    bool expire(const std::string& key, int ttl_seconds) override {
        const std::string suffix = ":chunks";
        if (fail_chunk_expire && key.size() > suffix.size() &&
            key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
            fail_chunk_expire = false;
            throw CoordinationStoreError("connection reset while expiring " + key);
        }
        return InMemoryCoordinationStore::expire(key, ttl_seconds);
    }

    // Fails the first record read made while the finalize lock is held
    std::optional<std::string> get(const std::string& key) override {
        if (!fail_read_while_finalizing.empty() && key == keys::transfer(fail_read_while_finalizing) &&
            InMemoryCoordinationStore::exists(keys::transferFinalizeLock(fail_read_while_finalizing))) {
            fail_read_while_finalizing.clear();
            throw CoordinationStoreError("connection reset while reading " + key);
        }
        return InMemoryCoordinationStore::get(key);
    }

    bool fail_chunk_expire = false;
    std::string fail_read_while_finalizing;
};

TransferSettings defaultChunks() {
    TransferSettings s;
    s.chunk_size = 65536;
    return s;
}

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace

TEST_CASE("a 10 MB file sent out of order completes with a verified checksum", "[transfer]") {
    TransferFixture f(defaultChunks());
    auto bob = f.h.connect("room-1", "bob");
    const std::string data = patternBytes(10 * 1024 * 1024);

    FileTransfer transfer = f.offer(data, crypto::sha256Hex(data), "video.bin");
    REQUIRE(transfer.total_chunks == 160);
    CHECK(transfer.status == TransferStatus::Offered);
    CHECK(bob->ofType(MessageType::FileTransferOffer).size() == 1);

    f.manager->accept(transfer.transfer_id, "bob");

    std::vector<int64_t> order(160);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(42);
    std::shuffle(order.begin(), order.end(), rng);

    ChunkReceipt receipt;
    for (int64_t index : order) {
        receipt = f.send(transfer, data, index);
        CHECK(receipt.accepted_new);
    }

    CHECK(receipt.progress.status == TransferStatus::Completed);
    CHECK(receipt.progress.chunks_acked == 160);
    CHECK(receipt.progress.percent == Approx(100.0));

    FileTransfer done = f.manager->get(transfer.transfer_id, "bob");
    CHECK(done.status == TransferStatus::Completed);
    CHECK(done.checksum_actual == crypto::sha256Hex(data));
    CHECK(readFile(done.storage_path) == data);
    CHECK(f.manager->activeTransferCount("alice") == 0);

    auto complete = bob->ofType(MessageType::FileTransferComplete);
    REQUIRE(complete.size() == 1);
    CHECK(complete[0].payload.find("\"success\":true") != std::string::npos);
    CHECK(bob->ofType(MessageType::FileTransferProgress).size() == 9);
}

TEST_CASE("offers are validated", "[transfer]") {
    TransferFixture f;
    TransferOffer request;
    request.room_id = "room-1";
    request.sender_id = "alice";
    request.receiver_id = "bob";
    request.filename = "a.txt";
    request.size_bytes = 10;

    SECTION("well formed") {
        auto transfer = f.manager->offer(request);
        CHECK(transfer.transfer_id.size() == 32);
        CHECK(transfer.mime_type == "application/octet-stream");
        CHECK(transfer.total_chunks == 1);
    }
    SECTION("to yourself") {
        request.receiver_id = "alice";
        CHECK(errorCodeOf([&] { f.manager->offer(request); }) == "validation_error");
    }
    SECTION("empty file") {
        request.size_bytes = 0;
        CHECK(errorCodeOf([&] { f.manager->offer(request); }) == "validation_error");
    }
    SECTION("long filename") {
        request.filename = std::string(256, 'x');
        CHECK(errorCodeOf([&] { f.manager->offer(request); }) == "validation_error");
    }
    SECTION("bad checksum") {
        request.checksum_expected = "abc123";
        CHECK(errorCodeOf([&] { f.manager->offer(request); }) == "validation_error");
    }
    SECTION("bad room") {
        request.room_id = "x";
        CHECK(errorCodeOf([&] { f.manager->offer(request); }) == "invalid_room_id");
    }
    SECTION("too large") {
        request.size_bytes = f.settings.max_file_size + 1;
        CHECK(errorCodeOf([&] { f.manager->offer(request); }) == "file_too_large");
        CHECK(f.manager->activeTransferCount("alice") == 0);
    }
}

TEST_CASE("duplicate chunks are acknowledged without double counting", "[transfer]") {
    TransferFixture f;
    const std::string data = patternBytes(5000);
    auto transfer = f.offer(data, crypto::sha256Hex(data));
    f.manager->accept(transfer.transfer_id, "bob");

    auto first = f.send(transfer, data, 2);
    CHECK(first.accepted_new);
    CHECK(f.manager->get(transfer.transfer_id, "alice").status == TransferStatus::Active);

    auto again = f.send(transfer, data, 2);
    CHECK_FALSE(again.accepted_new);
    CHECK(again.progress.chunks_acked == 1);
    CHECK(f.manager->progress(transfer.transfer_id, "bob").chunks_acked == 1);
}

TEST_CASE("chunks are checked before they are stored", "[transfer]") {
    TransferFixture f;
    const std::string data = patternBytes(5000);
    auto transfer = f.offer(data, "");
    const std::string chunk = data.substr(0, 1024);

    // Not accepted yet
    CHECK(errorCodeOf([&] { f.send(transfer, data, 0); }) == "invalid_state");
    f.manager->accept(transfer.transfer_id, "bob");

    CHECK(errorCodeOf([&] {
        f.manager->submitChunk(transfer.transfer_id, "bob", 0, chunk, crypto::sha256Hex(chunk));
    }) == "permission_denied");
    CHECK(errorCodeOf([&] {
        f.manager->submitChunk(transfer.transfer_id, "alice", 5, chunk, crypto::sha256Hex(chunk));
    }) == "validation_error");
    CHECK(errorCodeOf([&] {
        f.manager->submitChunk(transfer.transfer_id, "alice", 0, chunk.substr(1), crypto::sha256Hex(chunk));
    }) == "validation_error");
    CHECK(errorCodeOf([&] {
        f.manager->submitChunk(transfer.transfer_id, "alice", 0, chunk, crypto::sha256Hex("other"));
    }) == "validation_error");
    CHECK(errorCodeOf([&] {
        f.manager->submitChunk(transfer.transfer_id, "alice", 0, chunk, "");
    }) == "validation_error");
    CHECK_FALSE(f.storage->hasChunk(transfer.transfer_id, 0));

    // The last chunk is shorter
    CHECK(f.send(transfer, data, 4).accepted_new);
}

TEST_CASE("a checksum mismatch fails the transfer", "[transfer]") {
    TransferFixture f;
    auto alice = f.h.connect("room-1", "alice");
    const std::string data = patternBytes(3000);
    auto transfer = f.offer(data, crypto::sha256Hex("something else"));
    f.manager->accept(transfer.transfer_id, "bob");

    f.send(transfer, data, 0);
    f.send(transfer, data, 1);
    CHECK(errorCodeOf([&] { f.send(transfer, data, 2); }) == "checksum_mismatch");

    auto failed = f.manager->get(transfer.transfer_id, "alice");
    CHECK(failed.status == TransferStatus::Failed);
    CHECK(failed.error == "checksum_mismatch");
    CHECK(failed.checksum_actual == crypto::sha256Hex(data));
    CHECK_FALSE(f.storage->exists(transfer.transfer_id));
    CHECK(f.manager->activeTransferCount("alice") == 0);

    auto complete = alice->ofType(MessageType::FileTransferComplete);
    REQUIRE(complete.size() == 1);
    CHECK(complete[0].payload.find("\"code\":\"checksum_mismatch\"") != std::string::npos);
}

TEST_CASE("lifecycle transitions are idempotent where repeated", "[transfer]") {
    TransferFixture f;
    const std::string data = patternBytes(4096);
    auto transfer = f.offer(data, "");
    const std::string id = transfer.transfer_id;

    CHECK(errorCodeOf([&] { f.manager->accept(id, "alice"); }) == "permission_denied");
    CHECK(f.manager->accept(id, "bob").status == TransferStatus::Accepted);
    CHECK(f.manager->accept(id, "bob").status == TransferStatus::Accepted);

    // Pausing needs an active transfer
    CHECK(errorCodeOf([&] { f.manager->pause(id, "bob"); }) == "invalid_state");
    f.send(transfer, data, 0);

    CHECK(f.manager->pause(id, "bob").status == TransferStatus::Paused);
    CHECK(f.manager->pause(id, "alice").status == TransferStatus::Paused);
    CHECK(errorCodeOf([&] { f.send(transfer, data, 1); }) == "invalid_state");
    CHECK(errorCodeOf([&] { f.manager->pause(id, "mallory"); }) == "permission_denied");

    CHECK(f.manager->resume(id, "alice").status == TransferStatus::Active);
    CHECK(f.manager->resume(id, "alice").status == TransferStatus::Active);
    CHECK(f.send(transfer, data, 1).accepted_new);

    CHECK(f.manager->cancel(id, "bob").status == TransferStatus::Cancelled);
    CHECK(f.manager->cancel(id, "alice").status == TransferStatus::Cancelled);
    CHECK(errorCodeOf([&] { f.manager->resume(id, "alice"); }) == "invalid_state");
    CHECK(errorCodeOf([&] { f.manager->accept(id, "bob"); }) == "invalid_state");
    CHECK_FALSE(f.storage->exists(id));
    CHECK(f.manager->activeTransferCount("alice") == 0);
}

TEST_CASE("rejecting an offer frees the slot", "[transfer]") {
    TransferFixture f;
    auto alice = f.h.connect("room-1", "alice");
    auto transfer = f.offer(patternBytes(100), "");
    CHECK(f.manager->activeTransferCount("alice") == 1);

    CHECK(errorCodeOf([&] { f.manager->reject(transfer.transfer_id, "alice", ""); }) == "permission_denied");
    auto rejected = f.manager->reject(transfer.transfer_id, "bob", "busy");
    CHECK(rejected.status == TransferStatus::Rejected);
    CHECK(rejected.error == "busy");
    CHECK(f.manager->reject(transfer.transfer_id, "bob", "again").error == "busy");
    CHECK(f.manager->activeTransferCount("alice") == 0);

    auto notices = alice->ofType(MessageType::FileTransferReject);
    REQUIRE(notices.size() == 1);
    CHECK(notices[0].payload.find("\"reason\":\"busy\"") != std::string::npos);
}

TEST_CASE("a sender is limited to five concurrent transfers", "[transfer]") {
    TransferFixture f;
    std::vector<FileTransfer> offered;
    for (int i = 0; i < 5; ++i) {
        offered.push_back(f.offer(patternBytes(100, i), "", "file" + std::to_string(i) + ".bin"));
        f.h.clock.advanceMillis(10);
    }

    CHECK(errorCodeOf([&] { f.offer(patternBytes(100), ""); }) == "transfer_limit_reached");
    CHECK(f.manager->activeTransferCount("alice") == 5);

    auto listed = f.manager->listForUser("alice");
    REQUIRE(listed.size() == 5);
    CHECK(listed.front().transfer_id == offered.back().transfer_id);
    CHECK(f.manager->listForUser("bob", TransferStatus::Offered).size() == 5);
    CHECK(f.manager->listForUser("bob", TransferStatus::Active).empty());

    f.manager->cancel(offered[0].transfer_id, "alice");
    CHECK_NOTHROW(f.offer(patternBytes(100), ""));
}

TEST_CASE("inactive transfers are reaped", "[transfer]") {
    TransferFixture f;
    const std::string data = patternBytes(4096);
    auto transfer = f.offer(data, "");
    f.manager->accept(transfer.transfer_id, "bob");
    f.send(transfer, data, 0);

    f.h.clock.advanceSeconds(f.settings.timeout_seconds - 10);
    CHECK(f.manager->reapInactive() == 0);

    f.h.clock.advanceSeconds(20);
    CHECK(f.manager->reapInactive() == 1);

    auto reaped = f.manager->get(transfer.transfer_id, "alice");
    CHECK(reaped.status == TransferStatus::Failed);
    CHECK(reaped.error == "timeout");
    CHECK(f.manager->activeTransferCount("alice") == 0);
    CHECK_FALSE(f.storage->exists(transfer.transfer_id));

    CHECK(f.manager->reapInactive() == 0);
}

TEST_CASE("transfer details are private to the two parties", "[transfer]") {
    TransferFixture f;
    auto transfer = f.offer(patternBytes(100), "");
    CHECK(errorCodeOf([&] { f.manager->get(transfer.transfer_id, "mallory"); }) == "permission_denied");
    CHECK(errorCodeOf([&] { f.manager->progress(transfer.transfer_id, "mallory"); }) == "permission_denied");
    CHECK(errorCodeOf([&] { f.manager->get("missing", "alice"); }) == "transfer_not_found");
    CHECK(f.manager->listForUser("mallory").empty());

    const std::string view = f.manager->get(transfer.transfer_id, "bob").toViewJson();
    CHECK(view.find("\"percent\":0.00") != std::string::npos);
    CHECK(view.find("\"checksum_expected\":null") != std::string::npos);
    CHECK(view.find("\"status\":\"offered\"") != std::string::npos);
}

TEST_CASE("a chunk retried after a store failure still completes the transfer", "[transfer]") {
    TransferFixture f;
    auto flaky = std::make_shared<FlakyStore>(f.h.clock.clock());
    auto manager = std::make_shared<FileTransferManager>(flaky, f.h.relay, f.storage, f.settings, f.h.clock.clock());

    const std::string data = patternBytes(2000);
    TransferOffer request;
    request.room_id = "room-1";
    request.sender_id = "alice";
    request.receiver_id = "bob";
    request.filename = "notes.txt";
    request.size_bytes = static_cast<int64_t>(data.size());
    request.checksum_expected = crypto::sha256Hex(data);
    FileTransfer transfer = manager->offer(request);
    REQUIRE(transfer.total_chunks == 2);
    manager->accept(transfer.transfer_id, "bob");

    const std::string first = data.substr(0, 1024);
    const std::string last = data.substr(1024);
    CHECK(manager->submitChunk(transfer.transfer_id, "alice", 0, first, crypto::sha256Hex(first)).accepted_new);

    // The chunk lands in the set, then the connection drops
    flaky->fail_chunk_expire = true;
    CHECK(errorCodeOf([&] {
        manager->submitChunk(transfer.transfer_id, "alice", 1, last, crypto::sha256Hex(last));
    }) == "store_unavailable");
    CHECK(manager->get(transfer.transfer_id, "alice").chunks_acked == 1);

    ChunkReceipt retry = manager->submitChunk(transfer.transfer_id, "alice", 1, last, crypto::sha256Hex(last));
    CHECK_FALSE(retry.accepted_new);
    CHECK(retry.progress.status == TransferStatus::Completed);
    CHECK(retry.progress.chunks_acked == 2);

    FileTransfer done = manager->get(transfer.transfer_id, "bob");
    CHECK(done.status == TransferStatus::Completed);
    CHECK(readFile(done.storage_path) == data);
    CHECK(manager->activeTransferCount("alice") == 0);
}

TEST_CASE("a failed finalization releases its lock", "[transfer]") {
    TransferFixture f;
    auto flaky = std::make_shared<FlakyStore>(f.h.clock.clock());
    auto manager = std::make_shared<FileTransferManager>(flaky, f.h.relay, f.storage, f.settings, f.h.clock.clock());

    const std::string data = patternBytes(500);
    TransferOffer request;
    request.room_id = "room-1";
    request.sender_id = "alice";
    request.receiver_id = "bob";
    request.filename = "notes.txt";
    request.size_bytes = static_cast<int64_t>(data.size());
    FileTransfer transfer = manager->offer(request);
    manager->accept(transfer.transfer_id, "bob");

    flaky->fail_read_while_finalizing = transfer.transfer_id;
    CHECK(errorCodeOf([&] {
        manager->submitChunk(transfer.transfer_id, "alice", 0, data, crypto::sha256Hex(data));
    }) == "store_unavailable");
    CHECK_FALSE(flaky->exists(keys::transferFinalizeLock(transfer.transfer_id)));
    CHECK(manager->get(transfer.transfer_id, "alice").status == TransferStatus::Active);

    ChunkReceipt retry = manager->submitChunk(transfer.transfer_id, "alice", 0, data, crypto::sha256Hex(data));
    CHECK(retry.progress.status == TransferStatus::Completed);
}

TEST_CASE("executable file types are refused at offer time", "[transfer]") {
    TransferFixture f;
    CHECK(errorCodeOf([&] { f.offer(patternBytes(100), "", "setup.EXE"); }) == "validation_error");
    CHECK(errorCodeOf([&] { f.offer(patternBytes(100), "", "photos.zip.sh"); }) == "validation_error");
    CHECK(f.manager->activeTransferCount("alice") == 0);
    CHECK(f.manager->listForUser("alice").empty());

    CHECK_NOTHROW(f.offer(patternBytes(100), "", "archive.tar.gz"));
    CHECK_NOTHROW(f.offer(patternBytes(100), "", ".profile"));
    CHECK_NOTHROW(f.offer(patternBytes(100), "", "README"));

    SECTION("the list is configurable") {
        TransferSettings settings = TransferFixture::smallChunks();
        settings.blocked_extensions = {".txt"};
        TransferFixture custom(settings);
        CHECK(errorCodeOf([&] { custom.offer(patternBytes(100), "", "notes.txt"); }) == "validation_error");
        CHECK_NOTHROW(custom.offer(patternBytes(100), "", "setup.exe"));
    }
}

TEST_CASE("transfers are counted by status", "[transfer]") {
    TransferFixture f;
    CHECK(f.manager->countByStatus().empty());

    auto first = f.offer(patternBytes(100), "", "a.bin");
    auto second = f.offer(patternBytes(100), "", "b.bin");
    f.offer(patternBytes(100), "", "c.bin");
    f.manager->accept(first.transfer_id, "bob");
    f.manager->reject(second.transfer_id, "bob", "");

    auto counts = f.manager->countByStatus();
    CHECK(counts.size() == 3);
    CHECK(counts["accepted"] == 1);
    CHECK(counts["rejected"] == 1);
    CHECK(counts["offered"] == 1);
}
