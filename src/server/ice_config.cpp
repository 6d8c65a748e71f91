#include "../../include/server/ice_config.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <fstream>
#include <sstream>

namespace rendezvous {

namespace {

const char* kDefaultStunUrl = "stun:stun.l.google.com:19302";

void appendUrls(std::ostringstream& oss, const std::vector<std::string>& urls) {
    oss << "\"urls\":[";
    for (size_t i = 0; i < urls.size(); ++i) {
        if (i > 0) oss << ",";
        oss << JsonParser::quote(urls[i]);
    }
    oss << "]";
}

} // namespace

IceConfigProvider::IceConfigProvider(const IceSettings& settings) {
    if (!settings.config_file.empty()) {
        config_json_ = loadFile(settings.config_file);
        Logger::getInstance().info("ICE configuration loaded from " + settings.config_file);
    } else {
        config_json_ = build(settings);
    }
}

std::string IceConfigProvider::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("Cannot open ICE config file " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    std::string json = contents.str();
    if (!JsonParser::isObject(json)) {
        throw ValidationError("ICE config file " + path + " is not a JSON object");
    }
    return json;
}

std::string IceConfigProvider::build(const IceSettings& settings) {
    std::ostringstream oss;
    oss << "{\"ice_servers\":[";

    bool first = true;
    if (!settings.stun_urls.empty()) {
        oss << "{";
        appendUrls(oss, settings.stun_urls);
        oss << "}";
        first = false;
    }
    if (!settings.turn_urls.empty()) {
        if (!first) oss << ",";
        oss << "{";
        appendUrls(oss, settings.turn_urls);
        if (!settings.turn_username.empty()) {
            oss << ",\"username\":" << JsonParser::quote(settings.turn_username);
        }
        if (!settings.turn_credential.empty()) {
            oss << ",\"credential\":" << JsonParser::quote(settings.turn_credential);
        }
        oss << "}";
        first = false;
    }
    if (first) {
        oss << "{\"urls\":[" << JsonParser::quote(kDefaultStunUrl) << "]}";
    }

    oss << "],"
        << "\"ice_transport_policy\":" << JsonParser::quote(settings.ice_transport_policy) << ","
        << "\"bundle_policy\":" << JsonParser::quote(settings.bundle_policy) << ","
        << "\"rtcp_mux_policy\":" << JsonParser::quote(settings.rtcp_mux_policy)
        << "}";
    return oss.str();
}

} // namespace rendezvous
