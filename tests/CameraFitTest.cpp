#include <gtest/gtest.h>
#include <cmath>
#include "Viewer/CameraFit.hpp"
#include "TestSupport.hpp"

using namespace CadPreview;
using namespace CadPreview::testsupport;

namespace {

float expectedDistance(float radius, float vFovDeg, float aspect, float padding){
    float v = glm::radians(vFovDeg);
    float h = 2.0f * std::atan(std::tan(v / 2.0f) * aspect);
    return radius / std::sin(std::min(v, h) / 2.0f) * padding;
}

} // namespace

TEST(CameraFitTest, CentersAndGroundsTheObject) {
    auto object = makeBoxObject(glm::vec3(-1.0f, 2.0f, 3.0f), glm::vec3(3.0f, 4.0f, 5.0f));
    PerspectiveCamera camera;
    OrbitControls controls(&camera);
    FitStateRegistry registry;

    ASSERT_TRUE(fitAndCenter(*object, camera, controls, 800, 600, registry));
    Box3 box = computeWorldBoundingBox(*object);
    EXPECT_NEAR(box.min.z, 0.0f, 1e-5f);
    EXPECT_NEAR(box.max.z, 2.0f, 1e-5f);
    EXPECT_NEAR(box.center().x, 0.0f, 1e-5f);
    EXPECT_NEAR(box.center().y, 0.0f, 1e-5f);
    EXPECT_TRUE(registry.isCentered(object.get()));
}

TEST(CameraFitTest, DistanceFitsBoundingSphereInVerticalFov) {
    auto object = makeBoxObject(glm::vec3(-1.0f, 2.0f, 3.0f), glm::vec3(3.0f, 4.0f, 5.0f));
    PerspectiveCamera camera;
    OrbitControls controls(&camera);
    FitStateRegistry registry;
    ASSERT_TRUE(fitAndCenter(*object, camera, controls, 800, 600, registry));

    const float radius = std::sqrt(24.0f) / 2.0f;
    const float d = expectedDistance(radius, camera.fovDegrees, 800.0f / 600.0f, 1.25f);
    EXPECT_NEAR(camera.aspect, 800.0f / 600.0f, 1e-6f);
    EXPECT_NEAR(glm::length(camera.position), d, 1e-3f);
    glm::vec3 dir = glm::normalize(camera.position);
    EXPECT_NEAR(dir.x, 1.0f / std::sqrt(3.0f), 1e-4f);
    EXPECT_NEAR(dir.y, -1.0f / std::sqrt(3.0f), 1e-4f);
    EXPECT_NEAR(dir.z, 1.0f / std::sqrt(3.0f), 1e-4f);
    EXPECT_EQ(camera.target, glm::vec3(0.0f));
    EXPECT_LE(controls.minDistance, d);
    EXPECT_GE(controls.maxDistance, d);
    EXPECT_LT(camera.nearPlane, d - radius);
    EXPECT_GT(camera.farPlane, d + radius);
}

TEST(CameraFitTest, PortraitViewportUsesHorizontalFov) {
    auto wide = makeBoxObject(glm::vec3(0.0f), glm::vec3(2.0f));
    auto tall = makeBoxObject(glm::vec3(0.0f), glm::vec3(2.0f));
    PerspectiveCamera a, b;
    OrbitControls ca(&a), cb(&b);
    FitStateRegistry registry;
    ASSERT_TRUE(fitAndCenter(*wide, a, ca, 600, 600, registry));
    ASSERT_TRUE(fitAndCenter(*tall, b, cb, 300, 600, registry));

    const float radius = std::sqrt(12.0f) / 2.0f;
    EXPECT_NEAR(glm::length(b.position), expectedDistance(radius, b.fovDegrees, 0.5f, 1.25f), 1e-3f);
    EXPECT_GT(glm::length(b.position), glm::length(a.position));
}

TEST(CameraFitTest, RefitIsIdempotent) {
    auto object = makeBoxObject(glm::vec3(5.0f, 5.0f, 5.0f), glm::vec3(6.0f, 7.0f, 9.0f));
    PerspectiveCamera camera;
    OrbitControls controls(&camera);
    FitStateRegistry registry;
    ASSERT_TRUE(fitAndCenter(*object, camera, controls, 640, 480, registry));
    const glm::vec3 objectPos = object->position;
    const glm::vec3 camPos = camera.position;

    ASSERT_TRUE(fitAndCenter(*object, camera, controls, 640, 480, registry));
    EXPECT_EQ(object->position, objectPos);
    EXPECT_NEAR(glm::length(camera.position - camPos), 0.0f, 1e-5f);
}

TEST(CameraFitTest, EmptyObjectIsLeftAlone) {
    SceneNode empty;
    PerspectiveCamera camera;
    const glm::vec3 before = camera.position;
    OrbitControls controls(&camera);
    FitStateRegistry registry;
    EXPECT_FALSE(fitAndCenter(empty, camera, controls, 800, 600, registry));
    EXPECT_EQ(camera.position, before);
    EXPECT_FALSE(registry.isCentered(&empty));
}

TEST(CameraFitTest, PaddingScalesDistance) {
    auto a = makeBoxObject(glm::vec3(0.0f), glm::vec3(1.0f));
    auto b = makeBoxObject(glm::vec3(0.0f), glm::vec3(1.0f));
    PerspectiveCamera ca, cb;
    OrbitControls oa(&ca), ob(&cb);
    FitStateRegistry registry;
    FitOptions loose;
    loose.paddingFactor = 2.5f;
    ASSERT_TRUE(fitAndCenter(*a, ca, oa, 800, 600, registry));
    ASSERT_TRUE(fitAndCenter(*b, cb, ob, 800, 600, registry, loose));
    EXPECT_NEAR(glm::length(cb.position) / glm::length(ca.position), 2.0f, 1e-4f);
}

TEST(OrbitControlsTest, ZoomIsClampedToDistanceRange) {
    PerspectiveCamera camera;
    camera.position = glm::vec3(0.0f, -10.0f, 0.0f);
    OrbitControls controls(&camera);
    controls.minDistance = 5.0f;
    controls.maxDistance = 20.0f;
    controls.zoom(100.0f);
    EXPECT_TRUE(controls.update());
    EXPECT_NEAR(glm::length(camera.position), 5.0f, 1e-4f);
    controls.zoom(-100.0f);
    controls.update();
    EXPECT_NEAR(glm::length(camera.position), 20.0f, 1e-3f);
}
