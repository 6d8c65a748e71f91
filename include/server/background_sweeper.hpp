#ifndef BACKGROUND_SWEEPER_HPP
#define BACKGROUND_SWEEPER_HPP

#include "../signaling/signaling_relay.hpp"
#include "../transfer/file_transfer_manager.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace rendezvous {

struct SweepResult {
    size_t presence_removed = 0;
    size_t transfers_failed = 0;
};

// Periodic presence sweep and transfer reaping. Safe to run on every instance.
class BackgroundSweeper {
public:
    BackgroundSweeper(std::shared_ptr<SignalingRelay> relay,
                      std::shared_ptr<FileTransferManager> transfers,
                      int interval_seconds);
    ~BackgroundSweeper();

    void start();
    void stop();

    // One pass; errors are logged, not thrown
    SweepResult runOnce();

private:
    std::shared_ptr<SignalingRelay> relay_;
    std::shared_ptr<FileTransferManager> transfers_;
    int interval_seconds_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wait_mutex_;
    std::condition_variable wake_;
};

} // namespace rendezvous

#endif // BACKGROUND_SWEEPER_HPP
