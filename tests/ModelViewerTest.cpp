#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <thread>
#include "Viewer/ModelViewer.hpp"
#include "TestSupport.hpp"

using namespace CadPreview;
using namespace CadPreview::testsupport;

namespace {

const char* kUrl = "http://gateway/cad-preview?token=t1";

class ModelViewerTest : public ::testing::Test {
protected:
    void SetUp() override {
        fetcher = std::make_shared<FakeFetcher>();
        parser = std::make_shared<FakeParser>();
        device = std::make_shared<FakeRenderDevice>();
        options.synchronous = true;
    }

    std::unique_ptr<ModelViewer> makeViewer(){
        auto v = std::make_unique<ModelViewer>(fetcher, parser, device, options);
        v->setStatusCallback([this](ViewerStatus s, const std::optional<CadKind>&, const std::string& reason){
            statuses.push_back(s);
            reasons.push_back(reason);
        });
        return v;
    }

    static ViewerSource source(const std::string& url = kUrl){
        ViewerSource s;
        s.url = url;
        s.downloadUrl = "http://gateway/download/1";
        return s;
    }

    std::shared_ptr<FakeFetcher> fetcher;
    std::shared_ptr<FakeParser> parser;
    std::shared_ptr<FakeRenderDevice> device;
    ViewerOptions options;
    std::vector<ViewerStatus> statuses;
    std::vector<std::string> reasons;
};

} // namespace

TEST_F(ModelViewerTest, LoadsStlAndBecomesReady) {
    fetcher->respond(kUrl, okResponse(makeBinaryStl(2), "inline; filename=\"part.stl\""));
    auto viewer = makeViewer();
    viewer->setSource(source());

    ViewerState st = viewer->state();
    ASSERT_EQ(st.status, ViewerStatus::Ready);
    EXPECT_EQ(st.cadKind, CadKind::STL);
    EXPECT_EQ(st.fileName, "part.stl");
    EXPECT_TRUE(st.errorReason.empty());
    EXPECT_NE(viewer->object(), nullptr);
    ASSERT_NE(viewer->rig(), nullptr);
    EXPECT_EQ(parser->lastKind, CadKind::STL);
    EXPECT_EQ(device->initializeCalls, 1);
    EXPECT_EQ(device->geometryUploads, 1);
    EXPECT_EQ(device->materialCreates, 1);
    EXPECT_EQ(statuses, (std::vector<ViewerStatus>{ViewerStatus::Loading, ViewerStatus::Ready}));

    // grounded by the fit
    EXPECT_NEAR(computeWorldBoundingBox(*viewer->object()).min.z, 0.0f, 1e-5f);

    viewer->renderFrame();
    viewer->renderFrame();
    EXPECT_EQ(device->frames, 2);
}

TEST_F(ModelViewerTest, SharedGeometryIsUploadedAndReleasedOnce) {
    parser->shareGeometry = true;
    fetcher->respond(kUrl, okResponse(makeBinaryStl(1), "inline; filename=\"twin.stl\""));
    auto viewer = makeViewer();
    viewer->setSource(source());
    ASSERT_EQ(viewer->state().status, ViewerStatus::Ready);
    EXPECT_EQ(device->geometryUploads, 1);
    EXPECT_EQ(device->materialCreates, 1);

    viewer->clearSource();
    EXPECT_EQ(viewer->state().status, ViewerStatus::Idle);
    EXPECT_TRUE(device->liveGeometries.empty());
    EXPECT_TRUE(device->liveMaterials.empty());
    EXPECT_EQ(device->badReleases, 0);
    EXPECT_EQ(viewer->object(), nullptr);
}

TEST_F(ModelViewerTest, NewSourceReleasesPreviousObject) {
    fetcher->respond(kUrl, okResponse(makeBinaryStl(1), "inline; filename=\"a.stl\""));
    fetcher->respond("http://gateway/b", okResponse(bytesOf("glTF"), "inline; filename=\"b.glb\""));
    auto viewer = makeViewer();
    viewer->setSource(source());
    viewer->setSource(source("http://gateway/b"));
    ASSERT_EQ(viewer->state().status, ViewerStatus::Ready);
    EXPECT_EQ(viewer->state().cadKind, CadKind::GLB);
    EXPECT_EQ(device->geometryUploads, 2);
    EXPECT_EQ(device->liveGeometries.size(), 1u);
    EXPECT_EQ(device->liveMaterials.size(), 1u);
    EXPECT_EQ(device->initializeCalls, 1);
    EXPECT_EQ(device->badReleases, 0);
}

TEST_F(ModelViewerTest, DestructionReleasesEverythingAndDisposesDevice) {
    fetcher->respond(kUrl, okResponse(makeBinaryStl(1), "inline; filename=\"a.stl\""));
    {
        auto viewer = makeViewer();
        viewer->setSource(source());
        ASSERT_EQ(viewer->state().status, ViewerStatus::Ready);
    }
    EXPECT_TRUE(device->liveGeometries.empty());
    EXPECT_TRUE(device->liveMaterials.empty());
    EXPECT_EQ(device->disposeCalls, 1);
}

TEST_F(ModelViewerTest, NoAccelerationFailsBeforeFetching) {
    device->accelerated = false;
    auto viewer = makeViewer();
    viewer->setSource(source());
    ViewerState st = viewer->state();
    EXPECT_EQ(st.status, ViewerStatus::Error);
    EXPECT_EQ(st.errorReason, "no_3d_acceleration");
    EXPECT_EQ(st.message, ModelViewer::noAccelerationMessage());
    EXPECT_TRUE(st.canDownload());
    EXPECT_EQ(fetcher->calls, 0);
}

TEST_F(ModelViewerTest, DeviceInitFailureIsNoAcceleration) {
    device->initializeOk = false;
    fetcher->respond(kUrl, okResponse(makeBinaryStl(1), "inline; filename=\"a.stl\""));
    auto viewer = makeViewer();
    viewer->setSource(source());
    EXPECT_EQ(viewer->state().errorReason, "no_3d_acceleration");
    EXPECT_EQ(device->geometryUploads, 0);
    EXPECT_EQ(viewer->object(), nullptr);
}

TEST_F(ModelViewerTest, OversizedBodyIsNeverParsed) {
    options.maxRenderBytes = 1024 * 1024;
    fetcher->respond(kUrl, okResponse(std::vector<uint8_t>(1024 * 1024 + 1, 0), "inline; filename=\"huge.stl\""));
    auto viewer = makeViewer();
    viewer->setSource(source());
    ViewerState st = viewer->state();
    EXPECT_EQ(st.status, ViewerStatus::Error);
    EXPECT_EQ(st.errorReason, "file_too_large");
    EXPECT_EQ(st.message, "This CAD file is too large to safely render (over 1 MB). You can still download it.");
    EXPECT_EQ(st.message, viewer->fileTooLargeMessage());
    EXPECT_EQ(parser->calls, 0);
}

TEST_F(ModelViewerTest, FetchFailuresMapToReasons) {
    fetcher->respond("http://gateway/denied", errorResponse(401, "{\"ok\":false,\"error\":\"invalid_token\",\"requestId\":\"ab\"}"));
    fetcher->respond("http://gateway/boom", errorResponse(500, "{\"ok\":false,\"error\":\"storage_unavailable\"}"));
    fetcher->respond("http://gateway/html", errorResponse(502, "<html>bad gateway</html>"));
    auto viewer = makeViewer();

    viewer->setSource(source("http://gateway/denied"));
    EXPECT_EQ(viewer->state().errorReason, "access_denied");
    EXPECT_EQ(viewer->state().message, ModelViewer::genericFailureMessage());

    viewer->setSource(source("http://gateway/boom"));
    EXPECT_EQ(viewer->state().errorReason, "fetch_failed");

    viewer->setSource(source("http://gateway/html"));
    EXPECT_EQ(viewer->state().errorReason, "fetch_failed");

    viewer->setSource(source("http://gateway/unrouted"));
    EXPECT_EQ(viewer->state().errorReason, "fetch_failed");
    EXPECT_EQ(parser->calls, 0);
}

TEST_F(ModelViewerTest, StepFailuresUseStepReasons) {
    fetcher->respond("http://gateway/s1", errorResponse(502, "{\"ok\":false,\"error\":\"step_preview_unavailable\"}"));
    fetcher->respond("http://gateway/s2", errorResponse(404, "{\"ok\":false,\"error\":\"source_not_found\"}"));
    fetcher->respond("http://gateway/s3", errorResponse(401, "{\"ok\":false,\"error\":\"invalid_token\"}"));
    auto viewer = makeViewer();

    ViewerSource s = source("http://gateway/s1");
    s.kind = CadKind::STEP;
    viewer->setSource(s);
    EXPECT_EQ(viewer->state().errorReason, "step_preview_unavailable");
    EXPECT_EQ(viewer->state().cadKind, CadKind::STEP);

    s.url = "http://gateway/s2";
    viewer->setSource(s);
    EXPECT_EQ(viewer->state().errorReason, "failed_to_load_step_stl_preview");

    // hint from the declared name counts as well
    ViewerSource declared = source("http://gateway/s3");
    declared.declaredFilename = "Bracket.STEP";
    viewer->setSource(declared);
    EXPECT_EQ(viewer->state().errorReason, "failed_to_load_step_stl_preview");
}

TEST_F(ModelViewerTest, ParseFailureReasons) {
    parser->fail = true;
    fetcher->respond("http://gateway/obj", okResponse(bytesOf("garbage"), "inline; filename=\"m.obj\""));
    fetcher->respond("http://gateway/step", okResponse(bytesOf("garbage"), "inline; filename=\"m.stl\""));
    auto viewer = makeViewer();

    viewer->setSource(source("http://gateway/obj"));
    EXPECT_EQ(viewer->state().errorReason, "parse_failed");
    EXPECT_EQ(viewer->state().fileName, "m.obj");

    ViewerSource s = source("http://gateway/step");
    s.kind = CadKind::STEP;
    viewer->setSource(s);
    EXPECT_EQ(viewer->state().errorReason, "failed_to_load_step_stl_preview");
    EXPECT_EQ(device->initializeCalls, 0);
}

TEST_F(ModelViewerTest, UnclassifiableFileIsUnsupported) {
    fetcher->respond("http://gateway/plain", okResponse(bytesOf("data")));
    fetcher->respond("http://gateway/txt", okResponse(bytesOf("data"), "attachment; filename=\"notes.txt\""));
    auto viewer = makeViewer();

    viewer->setSource(source("http://gateway/plain"));
    EXPECT_EQ(viewer->state().status, ViewerStatus::Unsupported);
    EXPECT_EQ(viewer->state().errorReason, "unsupported_file_type");
    EXPECT_EQ(viewer->state().message, ModelViewer::unsupportedMessage());

    viewer->setSource(source("http://gateway/txt"));
    EXPECT_EQ(viewer->state().status, ViewerStatus::Unsupported);
    EXPECT_EQ(viewer->state().fileName, "notes.txt");
    EXPECT_TRUE(viewer->state().canDownload());
    EXPECT_EQ(parser->calls, 0);
}

TEST_F(ModelViewerTest, ClassificationPrecedence) {
    fetcher->respond(kUrl, okResponse(bytesOf("x"), "inline; filename=\"b.stl\""));
    auto viewer = makeViewer();

    ViewerSource explicitKind = source();
    explicitKind.kind = CadKind::OBJ;
    explicitKind.filenameOverride = "a.glb";
    viewer->setSource(explicitKind);
    EXPECT_EQ(parser->lastKind, CadKind::OBJ);

    ViewerSource overrideName = source();
    overrideName.filenameOverride = "a.glb";
    overrideName.declaredFilename = "c.obj";
    viewer->setSource(overrideName);
    EXPECT_EQ(parser->lastKind, CadKind::GLB);
    EXPECT_EQ(viewer->state().fileName, "a.glb");

    ViewerSource declared = source();
    declared.declaredFilename = "c.obj";
    viewer->setSource(declared);
    EXPECT_EQ(parser->lastKind, CadKind::STL);
    EXPECT_EQ(viewer->state().fileName, "b.stl");

    fetcher->respond(kUrl, okResponse(bytesOf("x"), "inline; filename=\"blob.bin\""));
    viewer->setSource(declared);
    EXPECT_EQ(parser->lastKind, CadKind::OBJ);
    EXPECT_EQ(viewer->state().status, ViewerStatus::Ready);
}

TEST_F(ModelViewerTest, EmptyUrlClearsToIdle) {
    fetcher->respond(kUrl, okResponse(makeBinaryStl(1), "inline; filename=\"a.stl\""));
    auto viewer = makeViewer();
    viewer->setSource(source());
    ASSERT_EQ(viewer->state().status, ViewerStatus::Ready);
    viewer->setSource(ViewerSource());
    EXPECT_EQ(viewer->state().status, ViewerStatus::Idle);
    EXPECT_FALSE(viewer->state().cadKind.has_value());
    EXPECT_TRUE(device->liveGeometries.empty());
    viewer->renderFrame();
    EXPECT_EQ(device->frames, 0);
}

TEST_F(ModelViewerTest, DownloadOnlySourceKeepsTheDownloadWithoutFetching) {
    fetcher->respond(kUrl, okResponse(makeBinaryStl(1), "inline; filename=\"a.stl\""));
    auto viewer = makeViewer();
    viewer->setSource(source());
    ASSERT_EQ(viewer->state().status, ViewerStatus::Ready);
    const int fetchesBefore = fetcher->calls;

    ViewerSource notes = source(std::string());
    notes.declaredFilename = "notes.txt";
    viewer->setSource(notes);
    EXPECT_EQ(viewer->state().status, ViewerStatus::Unsupported);
    EXPECT_EQ(viewer->state().errorReason, "unsupported_file_type");
    EXPECT_EQ(viewer->state().message, ModelViewer::unsupportedMessage());
    EXPECT_EQ(viewer->state().fileName, "notes.txt");
    EXPECT_TRUE(viewer->state().canDownload());
    EXPECT_EQ(viewer->state().downloadUrl, "http://gateway/download/1");
    EXPECT_EQ(fetcher->calls, fetchesBefore);
    EXPECT_TRUE(device->liveGeometries.empty());
    EXPECT_EQ(statuses.back(), ViewerStatus::Unsupported);
}

TEST_F(ModelViewerTest, ViewportResizeReachesDevice) {
    fetcher->respond(kUrl, okResponse(makeBinaryStl(1), "inline; filename=\"a.stl\""));
    auto viewer = makeViewer();
    viewer->setViewportSize(1024, 512);
    viewer->setSource(source());
    EXPECT_EQ(device->width, 1024);
    viewer->setViewportSize(300, 600);
    EXPECT_EQ(device->width, 300);
    EXPECT_EQ(device->height, 600);
    ASSERT_NE(viewer->rig(), nullptr);
    EXPECT_NEAR(viewer->rig()->camera.aspect, 0.5f, 1e-6f);
}

TEST_F(ModelViewerTest, SupersededAsyncLoadIsDropped) {
    options.synchronous = false;
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    const std::string slowUrl = "http://gateway/slow";
    fetcher->respond(slowUrl, okResponse(makeBinaryStl(1), "inline; filename=\"slow.obj\""));
    fetcher->respond(kUrl, okResponse(makeBinaryStl(1), "inline; filename=\"fast.stl\""));
    fetcher->beforeAnswer = [slowUrl, opened](const std::string& url){ if(url == slowUrl) opened.wait(); };

    auto viewer = makeViewer();
    viewer->setSource(source(slowUrl));
    EXPECT_TRUE(viewer->isLoading());
    viewer->setSource(source());
    gate.set_value();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while(viewer->state().status != ViewerStatus::Ready && std::chrono::steady_clock::now() < deadline){
        viewer->processPendingUploads();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(viewer->state().status, ViewerStatus::Ready);
    EXPECT_EQ(viewer->state().fileName, "fast.stl");
    EXPECT_EQ(parser->calls, 1);
    EXPECT_EQ(device->geometryUploads, 1);
}

TEST_F(ModelViewerTest, DestroyingViewerDuringLoadIsSafe) {
    options.synchronous = false;
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    fetcher->respond(kUrl, okResponse(makeBinaryStl(1), "inline; filename=\"a.stl\""));
    fetcher->beforeAnswer = [opened](const std::string&){ opened.wait(); };
    {
        auto viewer = makeViewer();
        viewer->setSource(source());
    }
    gate.set_value();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while(fetcher->calls < 1 && std::chrono::steady_clock::now() < deadline){
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(device->geometryUploads, 0);
    EXPECT_EQ(device->disposeCalls, 0);
}
