#include "Preview/GatewayHttpServer.hpp"
#include "stringUtils.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace CadPreview {

static void sendJson(httplib::Response& res, int status, const nlohmann::json& body){
    res.status = status;
    res.set_header("Cache-Control", "no-store");
    res.set_content(body.dump(), "application/json");
}

GatewayHttpServer::GatewayHttpServer(const PreviewConfig& config,
                                     std::shared_ptr<PreviewGateway> gateway,
                                     std::shared_ptr<PreviewCatalog> catalog,
                                     std::shared_ptr<FileRecordRepository> records)
    : config_(config), gateway_(std::move(gateway)), catalog_(std::move(catalog)), records_(std::move(records)),
      server_(std::make_unique<httplib::Server>()) {
    int threads = config_.server.threads > 0 ? config_.server.threads : 8;
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<size_t>(threads)); };
    registerRoutes();
}

GatewayHttpServer::~GatewayHttpServer(){ stop(); }

CallerIdentity GatewayHttpServer::callerFrom(const httplib::Request& req) const {
    CallerIdentity c;
    c.userId = trimCopy(req.get_header_value(config_.server.userHeader));
    std::string role = trimCopy(req.get_header_value(config_.server.roleHeader));
    c.privileged = c.authenticated() && !role.empty() && equalsIgnoreCase(role, config_.server.privilegedRole);
    return c;
}

void GatewayHttpServer::registerRoutes(){
    server_->Get("/healthz", [](const httplib::Request&, httplib::Response& res){
        sendJson(res, 200, {{"ok", true}});
    });

    server_->Get(config_.gateway.previewEndpoint, [this](const httplib::Request& req, httplib::Response& res){
        PreviewRequest pr;
        pr.token = req.get_param_value("token");
        pr.bucket = req.get_param_value("bucket");
        pr.path = req.get_param_value("path");
        pr.kind = req.get_param_value("kind");
        pr.disposition = req.get_param_value("disposition");
        pr.previewAs = req.get_param_value("previewAs");
        try {
            PreviewResponse out = gateway_->handle(pr, callerFrom(req));
            res.status = out.status;
            res.set_header("Cache-Control", out.cacheControl);
            if(!out.requestId.empty()) res.set_header("X-Request-Id", out.requestId);
            if(!out.contentDisposition.empty()) res.set_header("Content-Disposition", out.contentDisposition);
            res.set_content(reinterpret_cast<const char*>(out.body.data()), out.body.size(), out.contentType);
        } catch (const std::exception& ex) {
            PLOGE << "[cad-preview] unhandled error: " << ex.what();
            sendJson(res, 500, {{"ok", false}, {"error", "internal_error"}});
        }
    });

    server_->Get("/quote-files", [this](const httplib::Request& req, httplib::Response& res){
        CallerIdentity caller = callerFrom(req);
        if(!caller.authenticated()){ sendJson(res, 401, {{"ok", false}, {"error", "unauthorized"}}); return; }
        std::string quoteId = trimCopy(req.get_param_value("quoteId"));
        if(quoteId.empty()){ sendJson(res, 400, {{"ok", false}, {"error", "missing_quote_id"}}); return; }
        if(!records_){ sendJson(res, 503, {{"ok", false}, {"error", "no_database"}}); return; }

        QuoteFileSource quote;
        std::vector<FileRecord> records;
        {
            std::lock_guard<std::mutex> lock(recordsMutex_);
            std::string err;
            if(!records_->loadQuote(quoteId, quote, &err)){
                PLOGW << "GatewayHttpServer: quote " << quoteId << " not loaded: " << err;
                sendJson(res, 404, {{"ok", false}, {"error", "quote_not_found"}});
                return;
            }
            records = records_->loadFileRecords(quote, &err);
            if(!err.empty()) PLOGW << "GatewayHttpServer: file records for " << quoteId << ": " << err;
        }
        auto entries = catalog_->build(quote.quoteId, quote.declaredNames(), records, caller);
        nlohmann::json arr = nlohmann::json::array();
        for(const auto& e : entries) arr.push_back(e.toJSON());
        sendJson(res, 200, {{"ok", true}, {"quoteId", quote.quoteId}, {"files", arr}});
    });
}

bool GatewayHttpServer::listen(std::string* outError){
    PLOGI << "GatewayHttpServer: listening on " << config_.server.host << ":" << config_.server.port;
    if(!server_->listen(config_.server.host.c_str(), config_.server.port)){
        if(outError) *outError = "could not bind " + config_.server.host + ":" + std::to_string(config_.server.port);
        return false;
    }
    return true;
}

void GatewayHttpServer::stop(){
    if(server_ && server_->is_running()) server_->stop();
}

} // namespace CadPreview
