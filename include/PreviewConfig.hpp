#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace CadPreview {

// Settings shared by the gateway and the viewer. Loaded from a JSON file,
// then overridden from the environment.
struct PreviewConfig {
    struct Server {
        std::string host = "127.0.0.1";
        int port = 8787;
        int threads = 8;
        std::string userHeader = "X-Preview-User";
        std::string roleHeader = "X-Preview-Role";
        std::string privilegedRole = "admin";
    } server;

    struct Token {
        std::string secret;
        int64_t ttlSeconds = 60 * 60;
    } token;

    struct Storage {
        std::string backend = "local"; // "local" | "http"
        std::string localRoot = "storage";
        std::string baseUrl;
        std::string serviceKey;
        long timeoutSeconds = 30;
    } storage;

    struct Resolver {
        std::vector<std::string> allowedBuckets{"cad_uploads", "cad_previews"};
        std::string defaultBucket;
    } resolver;

    struct Gateway {
        uint64_t maxPreviewBytes = 50ull * 1024ull * 1024ull;
        std::string stepPreviewBucket = "cad_previews";
        std::string previewEndpoint = "/preview";
    } gateway;

    struct Step {
        // {input} and {output} are replaced with temp file paths
        std::string converterCommand;
        int timeoutSeconds = 120;
    } step;

    struct Database {
        std::string sqlitePath;
    } database;

    struct Viewer {
        uint64_t maxRenderBytes = 20ull * 1024ull * 1024ull;
        float paddingFactor = 1.25f;
        std::string gatewayUrl = "http://127.0.0.1:8787";
    } viewer;

    struct Catalog {
        bool probeOnSign = false;
    } catalog;

    struct Log {
        std::string level = "info";
        std::string file;
    } log;

    static bool loadFromFile(const std::string& path, PreviewConfig& out, std::string* outError = nullptr);
    static bool loadFromJson(const nlohmann::json& j, PreviewConfig& out, std::string* outError = nullptr);

    // CAD_PREVIEW_TOKEN_SECRET (falls back to SUPABASE_SERVICE_ROLE_KEY),
    // CAD_PREVIEW_STORAGE_URL, CAD_PREVIEW_DEFAULT_BUCKET
    void applyEnvironment();

    // Checks that must pass before the gateway serves anything.
    bool validateForGateway(std::string* outError = nullptr) const;
};

} // namespace CadPreview
