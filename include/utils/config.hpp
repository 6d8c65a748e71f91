#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace rendezvous {

struct RedisSettings {
    std::string host = "localhost";
    int port = 6379;
    std::string password;
    int db = 0;
    size_t pool_size = 4;
};

struct IceSettings {
    std::string config_file;
    std::vector<std::string> stun_urls;
    std::vector<std::string> turn_urls;
    std::string turn_username;
    std::string turn_credential;
    std::string ice_transport_policy = "all";
    std::string bundle_policy = "balanced";
    std::string rtcp_mux_policy = "require";
};

struct SignalingSettings {
    int presence_ttl_seconds = 30;
    size_t buffer_size = 50;
    int buffer_ttl_seconds = 300;
    int grace_window_seconds = 300;
    size_t max_participants = 50;
    size_t max_message_bytes = 1048576;
};

struct TransferSettings {
    int64_t chunk_size = 65536;
    int64_t max_file_size = 524288000;
    int64_t max_concurrent = 5;
    int timeout_seconds = 3600;
    std::string storage_dir = "/tmp/rendezvous_transfers";
    // Lower-case, with the leading dot
    std::vector<std::string> blocked_extensions = {
        ".exe", ".bat", ".cmd", ".com", ".pif", ".scr", ".vbs", ".vbe",
        ".js", ".jse", ".wsf", ".wsh", ".msi", ".msp", ".dll", ".sh",
        ".bash", ".zsh", ".app", ".deb", ".rpm", ".dmg", ".pkg"};
};

struct Config {
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    size_t io_threads = 1;
    std::string instance_id;
    std::string store_backend = "redis";
    std::string jwt_secret;
    std::string log_level = "info";
    std::string log_file;
    int sweep_interval_seconds = 10;

    RedisSettings redis;
    SignalingSettings signaling;
    TransferSettings transfer;
    IceSettings ice;

    // Reads RENDEZVOUS_* variables. Throws ValidationError on malformed or out-of-range values.
    static Config fromEnvironment();

    // Throws ValidationError when a combination of settings cannot run
    void validate() const;
};

} // namespace rendezvous

#endif // CONFIG_HPP
