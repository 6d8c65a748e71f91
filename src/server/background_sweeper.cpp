#include "../../include/server/background_sweeper.hpp"
#include "../../include/utils/logger.hpp"

#include <algorithm>
#include <chrono>

namespace rendezvous {

BackgroundSweeper::BackgroundSweeper(std::shared_ptr<SignalingRelay> relay,
                                     std::shared_ptr<FileTransferManager> transfers,
                                     int interval_seconds)
    : relay_(std::move(relay))
    , transfers_(std::move(transfers))
    , interval_seconds_(std::max(1, interval_seconds)) {
}

BackgroundSweeper::~BackgroundSweeper() {
    stop();
}

void BackgroundSweeper::start() {
    if (running_.exchange(true)) return;

    worker_ = std::thread([this]() {
        Logger::getInstance().info("BackgroundSweeper started, interval " + std::to_string(interval_seconds_) + "s");

        while (running_) {
            runOnce();

            std::unique_lock<std::mutex> lock(wait_mutex_);
            wake_.wait_for(lock, std::chrono::seconds(interval_seconds_), [this]() { return !running_; });
        }

        Logger::getInstance().info("BackgroundSweeper stopped");
    });
}

void BackgroundSweeper::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

SweepResult BackgroundSweeper::runOnce() {
    SweepResult result;
    try {
        result.presence_removed = relay_->sweepPresence();
        if (result.presence_removed > 0) {
            Logger::getInstance().info("Presence sweep removed " + std::to_string(result.presence_removed) +
                                       " participants");
        }
    } catch (const std::exception& e) {
        Logger::getInstance().warning(std::string("Presence sweep error: ") + e.what());
    }

    try {
        result.transfers_failed = transfers_->reapInactive();
        if (result.transfers_failed > 0) {
            Logger::getInstance().info("Transfer reaper failed " + std::to_string(result.transfers_failed) +
                                       " idle transfers");
        }
    } catch (const std::exception& e) {
        Logger::getInstance().warning(std::string("Transfer reaper error: ") + e.what());
    }
    return result;
}

} // namespace rendezvous
