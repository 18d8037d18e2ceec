#include "PreviewConfig.hpp"
#include "StorageResolver.hpp"
#include "StorageBackends/LocalStorageBackend.hpp"
#include "StorageBackends/HttpStorageBackend.hpp"
#include "Preview/PreviewToken.hpp"
#include "Preview/StepConverter.hpp"
#include "Preview/StepPreviewService.hpp"
#include "Preview/PreviewGateway.hpp"
#include "Preview/PreviewCatalog.hpp"
#include "Preview/GatewayHttpServer.hpp"
#include "db/SQLiteBackend.hpp"
#include "db/FileRecordRepository.hpp"

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>

static CadPreview::GatewayHttpServer* g_server = nullptr;

static void handleSignal(int){
    if(g_server) g_server->stop();
}

static void usage(const char* argv0){
    std::cerr << "usage: " << argv0 << " [--config path.json]\n";
}

int main(int argc, char** argv)
{
    std::string configPath;
    for(int i = 1; i < argc; ++i){
        if((std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "-c") == 0) && i + 1 < argc) configPath = argv[++i];
        else if(std::strcmp(argv[i], "--help") == 0){ usage(argv[0]); return 0; }
        else { usage(argv[0]); return 2; }
    }

    CadPreview::PreviewConfig config;
    std::string err;
    if(!configPath.empty() && !CadPreview::PreviewConfig::loadFromFile(configPath, config, &err)){
        std::cerr << err << "\n";
        return 1;
    }
    config.applyEnvironment();

    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    plog::init(plog::severityFromString(config.log.level.c_str()), &consoleAppender);
    static std::unique_ptr<plog::RollingFileAppender<plog::TxtFormatter>> fileAppender;
    if(!config.log.file.empty()){
        fileAppender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(config.log.file.c_str(), 5 * 1024 * 1024, 3);
        plog::get()->addAppender(fileAppender.get());
    }
    PLOGI << "plog initialized (" << config.log.level << " -> stderr)";

    if(!config.validateForGateway(&err)){
        PLOGE << "configuration error: " << err;
        return 1;
    }

    std::shared_ptr<CadPreview::StorageBackend> storage;
    if(config.storage.backend == "http"){
        auto http = std::make_shared<CadPreview::HttpStorageBackend>(config.storage.baseUrl, config.storage.serviceKey);
        http->setTimeoutSeconds(config.storage.timeoutSeconds);
        storage = http;
    } else {
        storage = std::make_shared<CadPreview::LocalStorageBackend>(config.storage.localRoot);
    }

    CadPreview::ResolverConfig rc = CadPreview::ResolverConfig::defaults();
    rc.allowedBuckets = config.resolver.allowedBuckets;
    rc.defaultBucket = config.resolver.defaultBucket;
    auto resolver = std::make_shared<CadPreview::StorageResolver>(rc);
    auto tokens = std::make_shared<CadPreview::PreviewTokenIssuer>(config.token.secret, config.token.ttlSeconds);

    auto converter = std::make_shared<CadPreview::ExternalStepConverter>(config.step.converterCommand, config.step.timeoutSeconds);
    if(!converter->available()) PLOGW << "no STEP converter configured; STEP previews will report step_preview_unavailable";
    auto stepPreviews = std::make_shared<CadPreview::StepPreviewService>(storage, converter, config.gateway.stepPreviewBucket, config.gateway.maxPreviewBytes);

    CadPreview::GatewayOptions gopts;
    gopts.maxPreviewBytes = config.gateway.maxPreviewBytes;
    auto gateway = std::make_shared<CadPreview::PreviewGateway>(storage, tokens, resolver, stepPreviews, gopts);

    CadPreview::CatalogOptions copts;
    copts.previewEndpoint = config.gateway.previewEndpoint;
    copts.ttlSeconds = config.token.ttlSeconds;
    copts.probeOnSign = config.catalog.probeOnSign;
    auto catalog = std::make_shared<CadPreview::PreviewCatalog>(resolver, tokens, storage, copts);

    std::shared_ptr<CadPreview::FileRecordRepository> records;
    if(!config.database.sqlitePath.empty()){
        auto db = std::make_shared<CadPreview::SQLiteBackend>();
        CadPreview::DBConnectionInfo info;
        info.path = config.database.sqlitePath;
        info.readOnly = true;
        if(!db->open(info, &err)){
            PLOGE << "could not open database " << config.database.sqlitePath << ": " << err;
            return 1;
        }
        records = std::make_shared<CadPreview::FileRecordRepository>(db);
    } else {
        PLOGW << "no database configured; /quote-files is disabled";
    }

    CadPreview::GatewayHttpServer server(config, gateway, catalog, records);
    g_server = &server;
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if(!server.listen(&err)){
        PLOGE << err;
        g_server = nullptr;
        return 1;
    }
    g_server = nullptr;
    PLOGI << "gateway stopped";
    return 0;
}
