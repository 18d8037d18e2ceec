#pragma once
#include "Preview/PreviewGateway.hpp"
#include "Preview/PreviewCatalog.hpp"
#include "db/FileRecordRepository.hpp"
#include "PreviewConfig.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace httplib { class Server; struct Request; }

namespace CadPreview {

// HTTP front for the gateway:
//   GET /preview      token or privileged bucket+path
//   GET /quote-files  preview rows for ?quoteId= (needs a database)
//   GET /healthz
class GatewayHttpServer {
public:
    GatewayHttpServer(const PreviewConfig& config,
                      std::shared_ptr<PreviewGateway> gateway,
                      std::shared_ptr<PreviewCatalog> catalog,
                      std::shared_ptr<FileRecordRepository> records);
    ~GatewayHttpServer();

    // Blocks until stop().
    bool listen(std::string* outError = nullptr);
    void stop();

    CallerIdentity callerFrom(const httplib::Request& req) const;

private:
    void registerRoutes();

    PreviewConfig config_;
    std::shared_ptr<PreviewGateway> gateway_;
    std::shared_ptr<PreviewCatalog> catalog_;
    std::shared_ptr<FileRecordRepository> records_;
    std::unique_ptr<httplib::Server> server_;
    std::mutex recordsMutex_;
};

} // namespace CadPreview
