#include "../../include/server/request_handler.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace rendezvous {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::string headerValue(const std::map<std::string, std::string>& headers, const std::string& name) {
    for (const auto& header : headers) {
        if (header.first.size() != name.size()) continue;
        bool same = std::equal(header.first.begin(), header.first.end(), name.begin(),
                               [](char a, char b) {
                                   return std::tolower(static_cast<unsigned char>(a)) ==
                                          std::tolower(static_cast<unsigned char>(b));
                               });
        if (same) return header.second;
    }
    return "";
}

std::map<std::string, JsonField> parseBody(const std::string& body) {
    if (body.empty()) {
        return {};
    }
    try {
        return JsonParser::parseObject(body);
    } catch (const std::invalid_argument& e) {
        throw ValidationError(std::string("Request body is not a JSON object: ") + e.what(),
                              ErrorCode::INVALID_PAYLOAD);
    }
}

ApiResponse errorResponse(const RendezvousError& e) {
    return ApiResponse{e.httpStatus(), JsonParser::createErrorResponse(e.codeName(), e.what())};
}

} // namespace

RequestHandler::RequestHandler(std::shared_ptr<CoordinationStore> store,
                               std::shared_ptr<TokenVerifier> verifier,
                               std::shared_ptr<RoomRegistry> registry,
                               std::shared_ptr<FileTransferManager> transfers,
                               std::shared_ptr<IceConfigProvider> ice_config,
                               std::shared_ptr<StatsCollector> stats,
                               const std::string& instance_id)
    : store_(std::move(store))
    , verifier_(std::move(verifier))
    , registry_(std::move(registry))
    , transfers_(std::move(transfers))
    , ice_config_(std::move(ice_config))
    , stats_(std::move(stats))
    , instance_id_(instance_id) {
}

ApiResponse RequestHandler::handleRequest(const std::string& method,
                                          const std::string& path,
                                          const std::map<std::string, std::string>& headers,
                                          const std::string& body) {
    // Strip query string for routing
    std::string clean_path = path;
    std::map<std::string, std::string> query;
    size_t qpos = clean_path.find('?');
    if (qpos != std::string::npos) {
        query = parseQuery(clean_path.substr(qpos + 1));
        clean_path = clean_path.substr(0, qpos);
    }
    if (clean_path.size() > 1 && clean_path.back() == '/') {
        clean_path.pop_back();
    }

    try {
        return route(method, clean_path, query, headers, body);
    } catch (const AuthError& e) {
        Logger::getInstance().warning("Rejected " + method + " " + clean_path + ": " + e.what());
        return errorResponse(e);
    } catch (const CoordinationStoreError& e) {
        Logger::getInstance().error("Store unavailable during " + method + " " + clean_path + ": " + e.what());
        return errorResponse(e);
    } catch (const RendezvousError& e) {
        Logger::getInstance().info(method + " " + clean_path + " failed with " + e.codeName() + ": " + e.what());
        return errorResponse(e);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Unhandled exception in " + method + " " + clean_path + ": " + e.what());
        return ApiResponse{500, JsonParser::createErrorResponse("internal_error", "Internal server error")};
    }
}

ApiResponse RequestHandler::route(const std::string& method,
                                  const std::string& path,
                                  const std::map<std::string, std::string>& query,
                                  const std::map<std::string, std::string>& headers,
                                  const std::string& body) {
    if (method == "OPTIONS") {
        return ApiResponse{204, ""};
    }

    const std::vector<std::string> parts = splitPath(path);

    if (method == "GET" && path == "/health") {
        return handleHealth();
    }

    if (method == "GET" && path == "/signal/config") {
        authenticate(headers);
        return ApiResponse{200, ice_config_->configJson()};
    }

    if (method == "GET" && (path == "/metrics" || path == "/stats")) {
        authenticate(headers);
        return ApiResponse{200, path == "/metrics" ? stats_->metricsJson() : stats_->statsJson()};
    }

    // POST /rooms/{room_id}/transfers
    if (parts.size() == 3 && parts[0] == "rooms" && parts[2] == "transfers") {
        if (method != "POST") {
            return ApiResponse{405, JsonParser::createErrorResponse("method_not_allowed", "Method not allowed")};
        }
        AuthenticatedUser user = authenticate(headers);
        return handleOfferTransfer(user, urlDecode(parts[1]), body);
    }

    // GET /rooms/{room_id}/participants
    if (parts.size() == 3 && parts[0] == "rooms" && parts[2] == "participants") {
        if (method != "GET") {
            return ApiResponse{405, JsonParser::createErrorResponse("method_not_allowed", "Method not allowed")};
        }
        authenticate(headers);
        return handleParticipants(urlDecode(parts[1]));
    }

    if (!parts.empty() && parts[0] == "transfers") {
        AuthenticatedUser user = authenticate(headers);

        if (parts.size() == 1) {
            if (method != "GET") {
                return ApiResponse{405, JsonParser::createErrorResponse("method_not_allowed", "Method not allowed")};
            }
            return handleListTransfers(user, query);
        }

        const std::string transfer_id = urlDecode(parts[1]);
        if (parts.size() == 2) {
            if (method == "DELETE") {
                return transferResponse(200, transfers_->cancel(transfer_id, user.user_id));
            }
            if (method == "GET") {
                return transferResponse(200, transfers_->get(transfer_id, user.user_id));
            }
            return ApiResponse{405, JsonParser::createErrorResponse("method_not_allowed", "Method not allowed")};
        }

        if (parts.size() == 3) {
            const std::string& action = parts[2];
            if (action == "progress") {
                if (method != "GET") {
                    return ApiResponse{405, JsonParser::createErrorResponse("method_not_allowed", "Method not allowed")};
                }
                TransferProgress progress = transfers_->progress(transfer_id, user.user_id);
                return ApiResponse{200, "{\"success\":true,\"progress\":" + progress.toJson(transfer_id) + "}"};
            }
            if (method != "POST") {
                return ApiResponse{405, JsonParser::createErrorResponse("method_not_allowed", "Method not allowed")};
            }
            return handleTransferAction(user, transfer_id, action, body);
        }
    }

    return ApiResponse{404, JsonParser::createErrorResponse("not_found", "No route for " + method + " " + path)};
}

ApiResponse RequestHandler::handleParticipants(const std::string& room_id) {
    RoomRegistry::validateRoomId(room_id);
    RoomMembership membership;
    membership.room_id = room_id;
    membership.participants = registry_->participants(room_id);

    std::ostringstream oss;
    oss << "{\"room_id\":" << JsonParser::quote(room_id)
        << ",\"participants\":" << membership.participantsJson()
        << ",\"participant_count\":" << membership.participants.size() << "}";
    return ApiResponse{200, oss.str()};
}

AuthenticatedUser RequestHandler::authenticate(const std::map<std::string, std::string>& headers) {
    const std::string authorization = headerValue(headers, "Authorization");
    if (authorization.empty()) {
        throw AuthError("Missing Authorization header", ErrorCode::UNAUTHORIZED);
    }
    const std::string token = bearerToken(authorization);
    if (token.empty()) {
        throw AuthError("Authorization header must use the Bearer scheme", ErrorCode::UNAUTHORIZED);
    }
    return verifier_->verify(token);
}

ApiResponse RequestHandler::handleHealth() {
    const bool store_up = store_->ping();
    std::ostringstream oss;
    oss << "{\"status\":\"ok\","
        << "\"store\":\"" << (store_up ? "up" : "down") << "\","
        << "\"instance_id\":" << JsonParser::quote(instance_id_)
        << "}";
    return ApiResponse{200, oss.str()};
}

ApiResponse RequestHandler::handleOfferTransfer(const AuthenticatedUser& user, const std::string& room_id,
                                                const std::string& body) {
    auto data = parseBody(body);

    TransferOffer offer;
    offer.room_id = room_id;
    offer.sender_id = user.user_id;
    try {
        offer.receiver_id = JsonParser::getString(data, "receiver_id");
        offer.filename = JsonParser::getString(data, "filename");
        offer.size_bytes = JsonParser::getInt(data, "size_bytes", -1);
        offer.mime_type = JsonParser::getString(data, "mime_type", "application/octet-stream");
        offer.checksum_expected = JsonParser::getString(data, "checksum");
    } catch (const std::invalid_argument& e) {
        throw ValidationError(std::string("Malformed transfer offer: ") + e.what(), ErrorCode::INVALID_PAYLOAD);
    }

    return transferResponse(201, transfers_->offer(offer));
}

ApiResponse RequestHandler::handleTransferAction(const AuthenticatedUser& user, const std::string& transfer_id,
                                                 const std::string& action, const std::string& body) {
    if (action == "accept") {
        return transferResponse(200, transfers_->accept(transfer_id, user.user_id));
    }
    if (action == "reject") {
        auto data = parseBody(body);
        std::string reason;
        try {
            reason = JsonParser::getString(data, "reason", "declined");
        } catch (const std::invalid_argument& e) {
            throw ValidationError(std::string("Malformed reject request: ") + e.what(), ErrorCode::INVALID_PAYLOAD);
        }
        return transferResponse(200, transfers_->reject(transfer_id, user.user_id, reason));
    }
    if (action == "pause") {
        return transferResponse(200, transfers_->pause(transfer_id, user.user_id));
    }
    if (action == "resume") {
        return transferResponse(200, transfers_->resume(transfer_id, user.user_id));
    }
    return ApiResponse{404, JsonParser::createErrorResponse("not_found", "Unknown transfer action " + action)};
}

ApiResponse RequestHandler::handleListTransfers(const AuthenticatedUser& user,
                                                const std::map<std::string, std::string>& query) {
    auto user_it = query.find("user_id");
    if (user_it != query.end() && !user_it->second.empty() && user_it->second != user.user_id) {
        throw PermissionError("Transfers of other users cannot be listed");
    }

    std::optional<TransferStatus> status;
    auto status_it = query.find("status");
    if (status_it != query.end() && !status_it->second.empty()) {
        status = transferStatusFromName(status_it->second);
    }

    std::vector<FileTransfer> list = transfers_->listForUser(user.user_id, status);
    std::ostringstream oss;
    oss << "{\"success\":true,\"transfers\":[";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) oss << ",";
        oss << list[i].toViewJson();
    }
    oss << "]}";
    return ApiResponse{200, oss.str()};
}

ApiResponse RequestHandler::transferResponse(int status, const FileTransfer& transfer) {
    return ApiResponse{status, "{\"success\":true,\"transfer\":" + transfer.toViewJson() + "}"};
}

std::map<std::string, std::string> RequestHandler::parseQuery(const std::string& query) {
    std::map<std::string, std::string> params;
    std::istringstream stream(query);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            params[urlDecode(pair)] = "";
        } else {
            params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
        }
    }
    return params;
}

std::string RequestHandler::urlDecode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < value.size() &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            result += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            result += c;
        }
    }
    return result;
}

} // namespace rendezvous
