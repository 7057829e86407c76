#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <hyperray/kernel/camera_ray.h>

using namespace hyperray;

namespace {

void RequireNear(const glm::vec4& actual, const glm::vec4& expected, float margin = 1e-5f) {
    for (int i = 0; i < 4; ++i) {
        INFO("component " << i);
        REQUIRE(actual[i] == Catch::Approx(expected[i]).margin(margin));
    }
}

} // namespace

TEST_CASE("Pixel to screen mapping", "[kernel][camera]") {
    const glm::uvec2 extent(200, 100);

    SECTION("Top-left pixel maps to the upper-left corner scaled by aspect") {
        const glm::vec2 screen = kernel::PixelToScreen(glm::uvec2(0, 0), extent);
        REQUIRE(screen.x == Catch::Approx(-2.0f));
        REQUIRE(screen.y == Catch::Approx(1.0f));
    }

    SECTION("Center pixel maps to the origin") {
        const glm::vec2 screen = kernel::PixelToScreen(glm::uvec2(100, 50), extent);
        REQUIRE(screen.x == Catch::Approx(0.0f).margin(1e-6));
        REQUIRE(screen.y == Catch::Approx(0.0f).margin(1e-6));
    }

    SECTION("Rows grow downward") {
        const glm::vec2 top = kernel::PixelToScreen(glm::uvec2(10, 10), extent);
        const glm::vec2 bottom = kernel::PixelToScreen(glm::uvec2(10, 90), extent);
        REQUIRE(top.y > bottom.y);
    }
}

TEST_CASE("Camera ray generation", "[kernel][camera]") {
    shared::Camera camera;
    camera.position = glm::vec4(1.0f, 2.0f, 3.0f, 4.0f);
    const glm::uvec2 extent(64, 64);

    SECTION("Center ray follows the forward axis") {
        const shared::Ray ray = kernel::GenerateCameraRay(glm::uvec2(32, 32), extent, camera);
        REQUIRE(ray.origin == camera.position);
        RequireNear(ray.direction, camera.forward);
    }

    SECTION("Corner ray at 90 degrees fov") {
        const shared::Ray ray = kernel::GenerateCameraRay(glm::uvec2(0, 0), glm::uvec2(200, 100), camera);
        RequireNear(ray.direction, glm::normalize(glm::vec4(-2.0f, 1.0f, 1.0f, 0.0f)));
    }

    SECTION("Directions are unit length") {
        for (unsigned y = 0; y < extent.y; y += 7) {
            for (unsigned x = 0; x < extent.x; x += 5) {
                const shared::Ray ray = kernel::GenerateCameraRay(glm::uvec2(x, y), extent, camera);
                REQUIRE(glm::length(ray.direction) == Catch::Approx(1.0f).margin(1e-5));
            }
        }
    }

    SECTION("Basis may point into the fourth axis") {
        camera.forward = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
        camera.right = glm::vec4(0.0f, 0.0f, -1.0f, 0.0f);
        const shared::Ray center = kernel::GenerateCameraRay(glm::uvec2(32, 32), extent, camera);
        RequireNear(center.direction, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));

        const shared::Ray left = kernel::GenerateCameraRay(glm::uvec2(0, 32), extent, camera);
        REQUIRE(left.direction.z > 0.0f);
        REQUIRE(left.direction.x == 0.0f);
    }
}
