#ifndef REQUEST_HANDLER_HPP
#define REQUEST_HANDLER_HPP

#include "ice_config.hpp"
#include "stats_collector.hpp"
#include "../auth/token_verifier.hpp"
#include "../signaling/room_registry.hpp"
#include "../store/coordination_store.hpp"
#include "../transfer/file_transfer_manager.hpp"
#include <map>
#include <memory>
#include <string>

namespace rendezvous {

struct ApiResponse {
    int status = 200;
    std::string body;
};

/**
 * Plain HTTP routes: health, ICE config, room participants, metrics and
 * the file transfer REST surface. Every route except /health needs a
 * bearer token.
 */
class RequestHandler {
public:
    RequestHandler(std::shared_ptr<CoordinationStore> store,
                   std::shared_ptr<TokenVerifier> verifier,
                   std::shared_ptr<RoomRegistry> registry,
                   std::shared_ptr<FileTransferManager> transfers,
                   std::shared_ptr<IceConfigProvider> ice_config,
                   std::shared_ptr<StatsCollector> stats,
                   const std::string& instance_id);

    // Never throws; failures are answered with an error body and status
    ApiResponse handleRequest(const std::string& method,
                              const std::string& path,
                              const std::map<std::string, std::string>& headers,
                              const std::string& body);

    static std::map<std::string, std::string> parseQuery(const std::string& query);
    static std::string urlDecode(const std::string& value);

private:
    ApiResponse route(const std::string& method,
                      const std::string& path,
                      const std::map<std::string, std::string>& query,
                      const std::map<std::string, std::string>& headers,
                      const std::string& body);

    AuthenticatedUser authenticate(const std::map<std::string, std::string>& headers);

    // API endpoints
    ApiResponse handleHealth();
    ApiResponse handleParticipants(const std::string& room_id);
    ApiResponse handleOfferTransfer(const AuthenticatedUser& user, const std::string& room_id, const std::string& body);
    ApiResponse handleTransferAction(const AuthenticatedUser& user, const std::string& transfer_id,
                                     const std::string& action, const std::string& body);
    ApiResponse handleListTransfers(const AuthenticatedUser& user, const std::map<std::string, std::string>& query);

    static ApiResponse transferResponse(int status, const FileTransfer& transfer);

    std::shared_ptr<CoordinationStore> store_;
    std::shared_ptr<TokenVerifier> verifier_;
    std::shared_ptr<RoomRegistry> registry_;
    std::shared_ptr<FileTransferManager> transfers_;
    std::shared_ptr<IceConfigProvider> ice_config_;
    std::shared_ptr<StatsCollector> stats_;
    std::string instance_id_;
};

} // namespace rendezvous

#endif // REQUEST_HANDLER_HPP
