#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "Preview/PreviewGateway.hpp"
#include "TestSupport.hpp"

using namespace CadPreview;
using namespace CadPreview::testsupport;

namespace {

class PreviewGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage = std::make_shared<MemoryStorageBackend>();
        issuer = std::make_shared<PreviewTokenIssuer>("gateway-secret", 600);
        converter = std::make_shared<FakeStepConverter>(makeBinaryStl(4));
        steps = std::make_shared<StepPreviewService>(storage, converter);
        gateway = std::make_unique<PreviewGateway>(storage, issuer, std::make_shared<StorageResolver>(), steps);
        alice.userId = "alice";
    }

    std::string tokenFor(const std::string& user, const std::string& path, std::optional<std::string> filename = std::nullopt){
        PreviewTokenPayload p;
        p.userId = user;
        p.bucket = "cad_uploads";
        p.path = path;
        p.filename = std::move(filename);
        std::string token;
        EXPECT_TRUE(issuer->issue(p, token));
        return token;
    }

    PreviewResponse get(const std::string& token, const CallerIdentity& who, const std::string& previewAs = std::string(),
                        const std::string& disposition = std::string()){
        PreviewRequest req;
        req.token = token;
        req.previewAs = previewAs;
        req.disposition = disposition;
        return gateway->handle(req, who);
    }

    static nlohmann::json bodyJson(const PreviewResponse& r){
        return nlohmann::json::parse(std::string(r.body.begin(), r.body.end()));
    }

    std::shared_ptr<MemoryStorageBackend> storage;
    std::shared_ptr<PreviewTokenIssuer> issuer;
    std::shared_ptr<FakeStepConverter> converter;
    std::shared_ptr<StepPreviewService> steps;
    std::unique_ptr<PreviewGateway> gateway;
    CallerIdentity alice;
};

} // namespace

TEST_F(PreviewGatewayTest, ServesOriginalBytesInline) {
    storage->add("cad_uploads", "quotes/q1/part.stl", makeBinaryStl(3));
    auto r = get(tokenFor("alice", "quotes/q1/part.stl"), alice);
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.contentType, "model/stl");
    EXPECT_EQ(r.contentDisposition, "inline; filename=\"part.stl\"");
    EXPECT_EQ(r.cacheControl, "no-store");
    EXPECT_EQ(r.body, makeBinaryStl(3));
    EXPECT_FALSE(r.requestId.empty());
}

TEST_F(PreviewGatewayTest, AttachmentUsesTokenFilenameWithoutQuotes) {
    storage->add("cad_uploads", "quotes/q1/ab12.obj", bytesOf("v 0 0 0\n"));
    auto r = get(tokenFor("alice", "quotes/q1/ab12.obj", std::string("my \"best\" part.obj")), alice, "", "ATTACHMENT");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.contentType, "text/plain");
    EXPECT_EQ(r.contentDisposition, "attachment; filename=\"my best part.obj\"");
}

TEST_F(PreviewGatewayTest, RejectsMissingTokenAndAnonymousCallers) {
    auto missing = get("", alice);
    EXPECT_EQ(missing.status, 400);
    EXPECT_EQ(missing.errorReason, "missing_token");
    EXPECT_EQ(missing.contentType, "application/json");
    auto j = bodyJson(missing);
    EXPECT_FALSE(j["ok"].get<bool>());
    EXPECT_EQ(j["error"].get<std::string>(), "missing_token");
    EXPECT_EQ(j["requestId"].get<std::string>(), missing.requestId);

    storage->add("cad_uploads", "a.stl", makeBinaryStl(1));
    auto anon = get(tokenFor("alice", "a.stl"), CallerIdentity{});
    EXPECT_EQ(anon.status, 401);
    EXPECT_EQ(anon.errorReason, "unauthorized");
}

TEST_F(PreviewGatewayTest, InvalidTokensAreUnauthorizedWithReason) {
    storage->add("cad_uploads", "a.stl", makeBinaryStl(1));
    auto garbage = get("not-a-token", alice);
    EXPECT_EQ(garbage.status, 401);
    EXPECT_EQ(garbage.errorReason, "invalid_token");
    EXPECT_EQ(bodyJson(garbage)["reason"].get<std::string>(), "token_format");

    auto stolen = get(tokenFor("bob", "a.stl"), alice);
    EXPECT_EQ(stolen.status, 401);
    EXPECT_EQ(bodyJson(stolen)["reason"].get<std::string>(), "token_user_mismatch");
    EXPECT_EQ(storage->gets, 0);
}

TEST_F(PreviewGatewayTest, DirectBucketAccessNeedsPrivilege) {
    storage->add("cad_uploads", "quotes/q1/part.stl", makeBinaryStl(2));
    PreviewRequest req;
    req.bucket = "cad-uploads";
    req.path = "/quotes/q1/part.stl";
    EXPECT_EQ(gateway->handle(req, alice).status, 403);

    CallerIdentity admin{"root", true};
    auto r = gateway->handle(req, admin);
    EXPECT_EQ(r.status, 200);

    req.bucket = "private_docs";
    auto denied = gateway->handle(req, admin);
    EXPECT_EQ(denied.status, 400);
    EXPECT_EQ(denied.errorReason, "bucket_not_allowed");
}

TEST_F(PreviewGatewayTest, UnsupportedKindMissingAndUnavailableObjects) {
    auto txt = get(tokenFor("alice", "notes.txt"), alice);
    EXPECT_EQ(txt.status, 400);
    EXPECT_EQ(txt.errorReason, "unsupported_kind");

    auto missing = get(tokenFor("alice", "gone.stl"), alice);
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(missing.errorReason, "source_not_found");

    storage->add("cad_uploads", "x.glb", bytesOf("glTF"));
    storage->failGets = true;
    auto down = get(tokenFor("alice", "x.glb"), alice);
    EXPECT_EQ(down.status, 502);
    EXPECT_EQ(down.errorReason, "storage_unavailable");
}

TEST_F(PreviewGatewayTest, UnclassifiedFileDownloadsAsOctetStream) {
    const auto original = bytesOf("line one\nline two\n");
    storage->add("cad_uploads", "quotes/q1/notes.txt", original);
    const std::string token = tokenFor("alice", "quotes/q1/notes.txt", std::string("notes.txt"));

    auto r = get(token, alice, std::string(), "attachment");
    ASSERT_EQ(r.status, 200) << r.errorReason;
    EXPECT_EQ(r.contentType, "application/octet-stream");
    EXPECT_EQ(r.contentDisposition, "attachment; filename=\"notes.txt\"");
    EXPECT_EQ(r.body, original);

    auto inlineView = get(token, alice, std::string(), "inline");
    EXPECT_EQ(inlineView.status, 400);
    EXPECT_EQ(inlineView.errorReason, "unsupported_kind");

    auto missing = get(tokenFor("alice", "quotes/q1/gone.txt"), alice, std::string(), "attachment");
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(missing.errorReason, "source_not_found");
}

TEST_F(PreviewGatewayTest, ExplicitKindOverridesExtension) {
    storage->add("cad_uploads", "blob", makeBinaryStl(1));
    PreviewRequest req;
    req.token = tokenFor("alice", "blob");
    req.kind = "stl";
    auto r = gateway->handle(req, alice);
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.contentType, "model/stl");
}

TEST_F(PreviewGatewayTest, OversizedObjectIs413) {
    GatewayOptions small;
    small.maxPreviewBytes = 100;
    PreviewGateway tight(storage, issuer, std::make_shared<StorageResolver>(), steps, small);
    storage->add("cad_uploads", "big.stl", makeBinaryStl(10));
    PreviewRequest req;
    req.token = tokenFor("alice", "big.stl");
    auto r = tight.handle(req, alice);
    EXPECT_EQ(r.status, 413);
    EXPECT_EQ(r.errorReason, "file_too_large");
}

TEST_F(PreviewGatewayTest, StepOriginalIsServedAsIs) {
    storage->add("cad_uploads", "quotes/q1/bracket.step", bytesOf("ISO-10303-21;"));
    auto r = get(tokenFor("alice", "quotes/q1/bracket.step"), alice);
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.contentType, "application/step");
    EXPECT_EQ(converter->calls, 0);
}

TEST_F(PreviewGatewayTest, StepPreviewConvertsOnceThenHitsCache) {
    storage->add("cad_uploads", "quotes/q1/bracket.step", bytesOf("ISO-10303-21;"));
    const std::string token = tokenFor("alice", "quotes/q1/bracket.step");

    auto first = get(token, alice, "stl_preview");
    ASSERT_EQ(first.status, 200);
    EXPECT_EQ(first.contentType, "model/stl");
    EXPECT_EQ(first.contentDisposition, "inline; filename=\"bracket.stl\"");
    EXPECT_EQ(first.body, makeBinaryStl(4));
    EXPECT_TRUE(storage->has("cad_previews", "step-previews/cad_uploads/quotes/q1/bracket.stl"));
    EXPECT_EQ(storage->lastPutContentType, "model/stl");

    auto second = get(token, alice, "stl_preview");
    ASSERT_EQ(second.status, 200);
    EXPECT_EQ(second.body, first.body);
    EXPECT_EQ(converter->calls, 1);
}

TEST_F(PreviewGatewayTest, StepPreviewCacheUploadFailureIsNotFatal) {
    storage->add("cad_uploads", "p.stp", bytesOf("ISO-10303-21;"));
    storage->failPuts = true;
    auto r = get(tokenFor("alice", "p.stp"), alice, "stl_preview");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(storage->puts, 1);
    EXPECT_FALSE(storage->has("cad_previews", "step-previews/cad_uploads/p.stl"));
}

TEST_F(PreviewGatewayTest, StepPreviewConverterFailureIs502) {
    auto broken = std::make_shared<FakeStepConverter>(std::vector<uint8_t>{}, false);
    PreviewGateway g(storage, issuer, std::make_shared<StorageResolver>(), std::make_shared<StepPreviewService>(storage, broken));
    storage->add("cad_uploads", "p.step", bytesOf("ISO-10303-21;"));
    PreviewRequest req;
    req.token = tokenFor("alice", "p.step");
    req.previewAs = "stl_preview";
    auto r = g.handle(req, alice);
    EXPECT_EQ(r.status, 502);
    EXPECT_EQ(r.errorReason, "step_preview_unavailable");

    broken->isAvailable = false;
    EXPECT_EQ(g.handle(req, alice).errorReason, "step_preview_unavailable");
    EXPECT_EQ(broken->calls, 1);
}

TEST(StepPreviewServiceTest, PreviewPathStripsStepExtension) {
    EXPECT_EQ(StepPreviewService::previewPathFor(StorageKey{"cad_uploads", "q/a.step"}), "step-previews/cad_uploads/q/a.stl");
    EXPECT_EQ(StepPreviewService::previewPathFor(StorageKey{"cad_uploads", "q/b.stp"}), "step-previews/cad_uploads/q/b.stl");
    EXPECT_EQ(StepPreviewService::previewPathFor(StorageKey{"cad_uploads", "q/c"}), "step-previews/cad_uploads/q/c.stl");
}

TEST(StepPreviewServiceTest, InvalidCachedPreviewIsRegenerated) {
    auto storage = std::make_shared<MemoryStorageBackend>();
    auto conv = std::make_shared<FakeStepConverter>(makeBinaryStl(2));
    StepPreviewService svc(storage, conv);
    storage->add("cad_uploads", "q/a.step", bytesOf("ISO-10303-21;"));
    storage->add("cad_previews", "step-previews/cad_uploads/q/a.stl", bytesOf("<html>oops</html>"));
    auto r = svc.fetchOrConvert(StorageKey{"cad_uploads", "q/a.step"}, "t1");
    ASSERT_TRUE(r.ok);
    EXPECT_FALSE(r.cacheHit);
    EXPECT_EQ(conv->calls, 1);
    EXPECT_EQ(storage->object("cad_previews", "step-previews/cad_uploads/q/a.stl"), makeBinaryStl(2));
}

TEST(StepPreviewServiceTest, MissingSourceIs404) {
    auto storage = std::make_shared<MemoryStorageBackend>();
    StepPreviewService svc(storage, std::make_shared<FakeStepConverter>(makeBinaryStl(1)));
    auto r = svc.fetchOrConvert(StorageKey{"cad_uploads", "none.step"}, "t2");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.error, "source_not_found");
}

TEST(LooksLikeStlTest, AcceptsBinaryAndAsciiOnly) {
    EXPECT_TRUE(looksLikeStl(makeBinaryStl(7)));
    EXPECT_TRUE(looksLikeStl(bytesOf("  solid part\n facet normal 0 0 1\n endfacet\nendsolid\n")));
    EXPECT_FALSE(looksLikeStl(bytesOf("solid but nothing else")));
    EXPECT_FALSE(looksLikeStl(bytesOf("{\"error\":\"x\"}")));
    auto truncated = makeBinaryStl(7);
    truncated.pop_back();
    EXPECT_FALSE(looksLikeStl(truncated));
}

TEST(ContentDispositionTest, StripsQuotesAndLineBreaks) {
    EXPECT_EQ(PreviewGateway::contentDisposition("inline", "a\"b\r\n.stl"), "inline; filename=\"ab.stl\"");
    EXPECT_EQ(PreviewGateway::contentDisposition("attachment", "\"\""), "attachment; filename=\"file\"");
}
