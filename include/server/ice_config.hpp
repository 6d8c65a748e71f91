#ifndef ICE_CONFIG_HPP
#define ICE_CONFIG_HPP

#include "../utils/config.hpp"
#include <string>

namespace rendezvous {

/**
 * Client-side RTCPeerConnection settings served at GET /signal/config.
 *
 * When a config file is set its contents are relayed verbatim; otherwise
 * the document is built from the STUN/TURN settings, falling back to a
 * public STUN server when none are configured.
 */
class IceConfigProvider {
public:
    // Throws ValidationError if the config file cannot be read or is not a JSON object
    explicit IceConfigProvider(const IceSettings& settings);

    const std::string& configJson() const { return config_json_; }

private:
    static std::string loadFile(const std::string& path);
    static std::string build(const IceSettings& settings);

    std::string config_json_;
};

} // namespace rendezvous

#endif // ICE_CONFIG_HPP
