#include <gtest/gtest.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "PreviewConfig.hpp"
#include "CryptoHelpers.hpp"
#include "StorageBackends/LocalStorageBackend.hpp"
#include "TestSupport.hpp"

using namespace CadPreview;
using namespace CadPreview::testsupport;

TEST(PreviewConfigTest, LoadsNestedSectionsOverDefaults) {
    auto j = nlohmann::json::parse(R"({
        "server": {"port": 9000, "userHeader": "X-User"},
        "token": {"secret": "abc", "ttlSeconds": 120},
        "storage": {"backend": "http", "baseUrl": "https://proj.example/storage/v1"},
        "resolver": {"allowedBuckets": ["cad_uploads"], "defaultBucket": "cad_uploads"},
        "viewer": {"maxRenderBytes": 1048576, "paddingFactor": 1.5},
        "log": {"level": "debug"}
    })");
    PreviewConfig cfg;
    std::string err;
    ASSERT_TRUE(PreviewConfig::loadFromJson(j, cfg, &err)) << err;
    EXPECT_EQ(cfg.server.port, 9000);
    EXPECT_EQ(cfg.server.userHeader, "X-User");
    EXPECT_EQ(cfg.server.host, "127.0.0.1");
    EXPECT_EQ(cfg.token.ttlSeconds, 120);
    EXPECT_EQ(cfg.resolver.allowedBuckets, (std::vector<std::string>{"cad_uploads"}));
    EXPECT_EQ(cfg.viewer.maxRenderBytes, 1048576u);
    EXPECT_FLOAT_EQ(cfg.viewer.paddingFactor, 1.5f);
    EXPECT_EQ(cfg.gateway.stepPreviewBucket, "cad_previews");
    EXPECT_TRUE(cfg.validateForGateway(&err)) << err;
}

TEST(PreviewConfigTest, RejectsWrongTypesAndBadFiles) {
    PreviewConfig cfg;
    std::string err;
    EXPECT_FALSE(PreviewConfig::loadFromJson(nlohmann::json::parse(R"({"server": {"port": "eighty"}})"), cfg, &err));
    EXPECT_NE(err.find("Invalid config value"), std::string::npos);
    EXPECT_FALSE(PreviewConfig::loadFromJson(nlohmann::json::array(), cfg, &err));
    EXPECT_FALSE(PreviewConfig::loadFromFile("/nonexistent/cad-preview.json", cfg, &err));
    EXPECT_NE(err.find("Could not open"), std::string::npos);
}

TEST(PreviewConfigTest, GatewayValidation) {
    PreviewConfig cfg;
    std::string err;
    EXPECT_FALSE(cfg.validateForGateway(&err));
    EXPECT_EQ(err, "missing_CAD_PREVIEW_TOKEN_SECRET");

    cfg.token.secret = "s";
    EXPECT_TRUE(cfg.validateForGateway(&err));

    cfg.storage.backend = "http";
    EXPECT_FALSE(cfg.validateForGateway(&err));
    cfg.storage.backend = "ftp";
    EXPECT_FALSE(cfg.validateForGateway(&err));
    EXPECT_EQ(err, "unknown storage.backend: ftp");
}

TEST(PreviewConfigTest, EnvironmentOverridesFile) {
    ::setenv("CAD_PREVIEW_TOKEN_SECRET", "from-env", 1);
    ::setenv("CAD_PREVIEW_STORAGE_URL", "https://proj.example/storage/v1", 1);
    ::setenv("CAD_PREVIEW_DEFAULT_BUCKET", "cad_uploads", 1);
    ::unsetenv("SUPABASE_SERVICE_ROLE_KEY");

    PreviewConfig cfg;
    cfg.token.secret = "from-file";
    cfg.applyEnvironment();
    EXPECT_EQ(cfg.token.secret, "from-env");
    EXPECT_EQ(cfg.storage.backend, "http");
    EXPECT_EQ(cfg.storage.baseUrl, "https://proj.example/storage/v1");
    EXPECT_EQ(cfg.resolver.defaultBucket, "cad_uploads");

    ::unsetenv("CAD_PREVIEW_TOKEN_SECRET");
    ::unsetenv("CAD_PREVIEW_STORAGE_URL");
    ::unsetenv("CAD_PREVIEW_DEFAULT_BUCKET");
}

class LocalStorageBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() / ("cadpreview_test_" + CryptoHelpers::randomHex(6));
        backend = std::make_unique<LocalStorageBackend>(root);
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::filesystem::path root;
    std::unique_ptr<LocalStorageBackend> backend;
};

TEST_F(LocalStorageBackendTest, PutGetAndList) {
    StorageKey key{"cad_previews", "step-previews/cad_uploads/q/a.stl"};
    ASSERT_TRUE(backend->put(key, makeBinaryStl(2), "model/stl").ok);
    auto got = backend->get(key);
    ASSERT_TRUE(got.ok) << got.error;
    EXPECT_EQ(got.data, makeBinaryStl(2));

    std::string err;
    auto entries = backend->list("cad_previews", "step-previews/cad_uploads/q", &err);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "a.stl");
    EXPECT_EQ(entries[0].size, makeBinaryStl(2).size());
}

TEST_F(LocalStorageBackendTest, MissingAndEscapingKeys) {
    auto missing = backend->get(StorageKey{"cad_uploads", "nope.stl"});
    EXPECT_FALSE(missing.ok);
    EXPECT_TRUE(missing.notFound);

    auto escape = backend->get(StorageKey{"cad_uploads", "../../etc/passwd"});
    EXPECT_FALSE(escape.ok);
    EXPECT_FALSE(escape.notFound);
    EXPECT_FALSE(backend->put(StorageKey{"..", "x.stl"}, bytesOf("x"), "model/stl").ok);

    std::string err;
    EXPECT_TRUE(backend->list("cad_uploads", "../..", &err).empty());
    EXPECT_EQ(err, "invalid prefix");
}
