#include "PreviewConfig.hpp"
#include <plog/Log.h>
#include <fstream>
#include <cstdlib>

namespace CadPreview {

template<typename T>
static void readIf(const nlohmann::json& j, const char* key, T& dest){
    if(j.contains(key) && !j[key].is_null()) dest = j[key].get<T>();
}

bool PreviewConfig::loadFromFile(const std::string& path, PreviewConfig& out, std::string* outError){
    std::ifstream file(path);
    if(!file.is_open()){
        if(outError) *outError = "Could not open config file: " + path;
        return false;
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        if(outError) *outError = std::string("Invalid config JSON: ") + e.what();
        return false;
    }
    return loadFromJson(j, out, outError);
}

bool PreviewConfig::loadFromJson(const nlohmann::json& j, PreviewConfig& out, std::string* outError){
    if(!j.is_object()){
        if(outError) *outError = "Config root must be an object";
        return false;
    }
    try {
        if(j.contains("server")){
            const auto& s = j["server"];
            readIf(s, "host", out.server.host);
            readIf(s, "port", out.server.port);
            readIf(s, "threads", out.server.threads);
            readIf(s, "userHeader", out.server.userHeader);
            readIf(s, "roleHeader", out.server.roleHeader);
            readIf(s, "privilegedRole", out.server.privilegedRole);
        }
        if(j.contains("token")){
            const auto& t = j["token"];
            readIf(t, "secret", out.token.secret);
            readIf(t, "ttlSeconds", out.token.ttlSeconds);
        }
        if(j.contains("storage")){
            const auto& s = j["storage"];
            readIf(s, "backend", out.storage.backend);
            readIf(s, "localRoot", out.storage.localRoot);
            readIf(s, "baseUrl", out.storage.baseUrl);
            readIf(s, "serviceKey", out.storage.serviceKey);
            readIf(s, "timeoutSeconds", out.storage.timeoutSeconds);
        }
        if(j.contains("resolver")){
            const auto& r = j["resolver"];
            readIf(r, "allowedBuckets", out.resolver.allowedBuckets);
            readIf(r, "defaultBucket", out.resolver.defaultBucket);
        }
        if(j.contains("gateway")){
            const auto& g = j["gateway"];
            readIf(g, "maxPreviewBytes", out.gateway.maxPreviewBytes);
            readIf(g, "stepPreviewBucket", out.gateway.stepPreviewBucket);
            readIf(g, "previewEndpoint", out.gateway.previewEndpoint);
        }
        if(j.contains("step")){
            const auto& s = j["step"];
            readIf(s, "converterCommand", out.step.converterCommand);
            readIf(s, "timeoutSeconds", out.step.timeoutSeconds);
        }
        if(j.contains("database")) readIf(j["database"], "sqlitePath", out.database.sqlitePath);
        if(j.contains("viewer")){
            const auto& v = j["viewer"];
            readIf(v, "maxRenderBytes", out.viewer.maxRenderBytes);
            readIf(v, "paddingFactor", out.viewer.paddingFactor);
            readIf(v, "gatewayUrl", out.viewer.gatewayUrl);
        }
        if(j.contains("catalog")) readIf(j["catalog"], "probeOnSign", out.catalog.probeOnSign);
        if(j.contains("log")){
            readIf(j["log"], "level", out.log.level);
            readIf(j["log"], "file", out.log.file);
        }
    } catch (const nlohmann::json::exception& e) {
        if(outError) *outError = std::string("Invalid config value: ") + e.what();
        return false;
    }
    return true;
}

static std::string envOrEmpty(const char* name){
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

void PreviewConfig::applyEnvironment(){
    std::string secret = envOrEmpty("CAD_PREVIEW_TOKEN_SECRET");
    if(secret.empty()) secret = envOrEmpty("SUPABASE_SERVICE_ROLE_KEY");
    if(!secret.empty()) token.secret = secret;

    std::string url = envOrEmpty("CAD_PREVIEW_STORAGE_URL");
    if(!url.empty()){
        storage.baseUrl = url;
        storage.backend = "http";
    }
    std::string serviceKey = envOrEmpty("SUPABASE_SERVICE_ROLE_KEY");
    if(!serviceKey.empty() && storage.serviceKey.empty()) storage.serviceKey = serviceKey;

    std::string bucket = envOrEmpty("CAD_PREVIEW_DEFAULT_BUCKET");
    if(!bucket.empty()) resolver.defaultBucket = bucket;
}

bool PreviewConfig::validateForGateway(std::string* outError) const {
    if(token.secret.empty()){
        if(outError) *outError = "missing_CAD_PREVIEW_TOKEN_SECRET";
        return false;
    }
    if(token.ttlSeconds <= 0){
        if(outError) *outError = "token.ttlSeconds must be positive";
        return false;
    }
    if(storage.backend == "http" && storage.baseUrl.empty()){
        if(outError) *outError = "storage.baseUrl is required for the http backend";
        return false;
    }
    if(storage.backend != "http" && storage.backend != "local"){
        if(outError) *outError = "unknown storage.backend: " + storage.backend;
        return false;
    }
    if(resolver.allowedBuckets.empty()){
        if(outError) *outError = "resolver.allowedBuckets is empty";
        return false;
    }
    PLOGV << "PreviewConfig: gateway config ok backend=" << storage.backend;
    return true;
}

} // namespace CadPreview
