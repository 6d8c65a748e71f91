#include "../../include/utils/config.hpp"
#include "../../include/common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace rendezvous {

namespace {

std::string envString(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    return std::string(value);
}

int64_t envInt(const char* name, int64_t fallback, int64_t min_value) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    int64_t parsed = 0;
    try {
        size_t consumed = 0;
        parsed = std::stoll(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        throw ValidationError(std::string(name) + " must be an integer, got '" + value + "'");
    }
    if (parsed < min_value) {
        throw ValidationError(std::string(name) + " must be at least " + std::to_string(min_value));
    }
    return parsed;
}

std::vector<std::string> envList(const char* name) {
    std::vector<std::string> items;
    std::stringstream ss(envString(name, ""));
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start == std::string::npos) continue;
        items.push_back(item.substr(start, end - start + 1));
    }
    return items;
}

std::string defaultInstanceId() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        std::snprintf(host, sizeof(host), "localhost");
    }
    return std::string(host) + "-" + std::to_string(::getpid());
}

} // namespace

Config Config::fromEnvironment() {
    Config config;

    config.address = envString("RENDEZVOUS_ADDRESS", config.address);
    int64_t port = envInt("RENDEZVOUS_PORT", config.port, 1);
    if (port > 65535) {
        throw ValidationError("RENDEZVOUS_PORT must be at most 65535");
    }
    config.port = static_cast<unsigned short>(port);

    unsigned int hw = std::thread::hardware_concurrency();
    config.io_threads = static_cast<size_t>(envInt("RENDEZVOUS_IO_THREADS", hw > 0 ? hw : 1, 1));
    config.instance_id = envString("RENDEZVOUS_INSTANCE_ID", defaultInstanceId());
    config.store_backend = envString("RENDEZVOUS_STORE", config.store_backend);
    config.jwt_secret = envString("RENDEZVOUS_JWT_SECRET", "");
    config.log_level = envString("RENDEZVOUS_LOG_LEVEL", config.log_level);
    config.log_file = envString("RENDEZVOUS_LOG_FILE", "");
    config.sweep_interval_seconds = static_cast<int>(envInt("RENDEZVOUS_SWEEP_INTERVAL", config.sweep_interval_seconds, 1));

    config.redis.host = envString("RENDEZVOUS_REDIS_HOST", config.redis.host);
    config.redis.port = static_cast<int>(envInt("RENDEZVOUS_REDIS_PORT", config.redis.port, 1));
    config.redis.password = envString("RENDEZVOUS_REDIS_PASSWORD", "");
    config.redis.db = static_cast<int>(envInt("RENDEZVOUS_REDIS_DB", config.redis.db, 0));
    config.redis.pool_size = static_cast<size_t>(envInt("RENDEZVOUS_REDIS_POOL_SIZE",
                                                        static_cast<int64_t>(config.redis.pool_size), 1));

    SignalingSettings& s = config.signaling;
    s.presence_ttl_seconds = static_cast<int>(envInt("RENDEZVOUS_PRESENCE_TTL", s.presence_ttl_seconds, 3));
    s.buffer_size = static_cast<size_t>(envInt("RENDEZVOUS_BUFFER_SIZE", static_cast<int64_t>(s.buffer_size), 1));
    s.buffer_ttl_seconds = static_cast<int>(envInt("RENDEZVOUS_BUFFER_TTL", s.buffer_ttl_seconds, 1));
    s.grace_window_seconds = static_cast<int>(envInt("RENDEZVOUS_GRACE_WINDOW", s.grace_window_seconds, 1));
    s.max_participants = static_cast<size_t>(envInt("RENDEZVOUS_MAX_PARTICIPANTS",
                                                    static_cast<int64_t>(s.max_participants), 2));
    s.max_message_bytes = static_cast<size_t>(envInt("RENDEZVOUS_MAX_MESSAGE_BYTES",
                                                     static_cast<int64_t>(s.max_message_bytes), 1024));

    TransferSettings& t = config.transfer;
    t.chunk_size = envInt("RENDEZVOUS_CHUNK_SIZE", t.chunk_size, 1);
    t.max_file_size = envInt("RENDEZVOUS_MAX_FILE_SIZE", t.max_file_size, 1);
    t.max_concurrent = envInt("RENDEZVOUS_MAX_CONCURRENT_TRANSFERS", t.max_concurrent, 1);
    t.timeout_seconds = static_cast<int>(envInt("RENDEZVOUS_TRANSFER_TIMEOUT", t.timeout_seconds, 1));
    t.storage_dir = envString("RENDEZVOUS_TRANSFER_DIR", t.storage_dir);
    if (std::getenv("RENDEZVOUS_BLOCKED_EXTENSIONS")) {
        t.blocked_extensions.clear();
        for (std::string ext : envList("RENDEZVOUS_BLOCKED_EXTENSIONS")) {
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            t.blocked_extensions.push_back(ext.front() == '.' ? ext : "." + ext);
        }
    }

    IceSettings& ice = config.ice;
    ice.config_file = envString("RENDEZVOUS_ICE_CONFIG_FILE", "");
    ice.stun_urls = envList("RENDEZVOUS_STUN_URLS");
    ice.turn_urls = envList("RENDEZVOUS_TURN_URLS");
    ice.turn_username = envString("RENDEZVOUS_TURN_USERNAME", "");
    ice.turn_credential = envString("RENDEZVOUS_TURN_CREDENTIAL", "");
    ice.ice_transport_policy = envString("RENDEZVOUS_ICE_TRANSPORT_POLICY", ice.ice_transport_policy);
    ice.bundle_policy = envString("RENDEZVOUS_BUNDLE_POLICY", ice.bundle_policy);
    ice.rtcp_mux_policy = envString("RENDEZVOUS_RTCP_MUX_POLICY", ice.rtcp_mux_policy);

    config.validate();
    return config;
}

void Config::validate() const {
    if (store_backend != "redis" && store_backend != "memory") {
        throw ValidationError("RENDEZVOUS_STORE must be 'redis' or 'memory'");
    }
    if (store_backend == "redis" && jwt_secret.empty()) {
        throw ValidationError("RENDEZVOUS_JWT_SECRET is required when RENDEZVOUS_STORE=redis");
    }
    if (transfer.chunk_size > transfer.max_file_size) {
        throw ValidationError("RENDEZVOUS_CHUNK_SIZE must not exceed RENDEZVOUS_MAX_FILE_SIZE");
    }
    if (ice.ice_transport_policy != "all" && ice.ice_transport_policy != "relay") {
        throw ValidationError("RENDEZVOUS_ICE_TRANSPORT_POLICY must be 'all' or 'relay'");
    }
    if (ice.bundle_policy != "balanced" && ice.bundle_policy != "max-compat" &&
        ice.bundle_policy != "max-bundle") {
        throw ValidationError("RENDEZVOUS_BUNDLE_POLICY must be balanced, max-compat or max-bundle");
    }
    if (ice.rtcp_mux_policy != "require" && ice.rtcp_mux_policy != "negotiate") {
        throw ValidationError("RENDEZVOUS_RTCP_MUX_POLICY must be 'require' or 'negotiate'");
    }
}

} // namespace rendezvous
