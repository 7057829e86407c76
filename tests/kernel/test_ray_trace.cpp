#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <hyperray/kernel/camera_ray.h>
#include <hyperray/kernel/path_trace.h>
#include <hyperray/kernel/ray_trace.h>
#include <hyperray/kernel/scene_intersect.h>

#include <vector>

using namespace hyperray;

namespace {

struct TestFrame {
    std::vector<shared::HyperSphere> spheres;
    std::vector<shared::Material> materials;
    shared::Camera camera;
    glm::uvec2 extent{0u};

    shared::FrameDesc Desc() const {
        shared::FrameDesc desc;
        desc.camera = camera;
        desc.scene.hyper_spheres = spheres;
        desc.scene.materials = materials;
        desc.render_extent = extent;
        return desc;
    }
};

// Unit hypersphere at the origin seen from (0, 0, -5, 0)
TestFrame MakeSphereFrame(const glm::uvec2& extent) {
    TestFrame frame;
    shared::HyperSphere sphere;
    sphere.radius = 1.0f;
    frame.spheres.push_back(sphere);
    frame.materials.emplace_back();
    frame.camera.position = glm::vec4(0.0f, 0.0f, -5.0f, 0.0f);
    frame.extent = extent;
    return frame;
}

} // namespace

TEST_CASE("Pixel seeds", "[kernel][raytrace]") {
    REQUIRE(kernel::PixelSeed(glm::uvec2(0, 0), glm::uvec2(8, 4)) == 0u);
    REQUIRE(kernel::PixelSeed(glm::uvec2(3, 2), glm::uvec2(8, 4)) == 19u);
    REQUIRE(kernel::PixelSeed(glm::uvec2(7, 3), glm::uvec2(8, 4)) == 31u);
}

TEST_CASE("Pixel shading", "[kernel][raytrace]") {
    SECTION("Center pixel sees the sphere four units away") {
        const glm::uvec2 extent(64, 64);
        TestFrame frame = MakeSphereFrame(extent);
        const glm::uvec2 center = extent / 2u;

        const shared::FrameDesc desc = frame.Desc();

        const shared::Ray ray = kernel::GenerateCameraRay(center, extent, desc.camera);
        const shared::Hit hit = kernel::IntersectScene(ray, desc.scene,
                                                       desc.camera.min_distance,
                                                       desc.camera.max_distance);
        REQUIRE(hit.hit);
        REQUIRE(hit.distance == Catch::Approx(4.0f).margin(1e-4));
        REQUIRE(hit.normal.z == Catch::Approx(-1.0f).margin(1e-4));
        REQUIRE(hit.normal.x == Catch::Approx(0.0f).margin(1e-4));
        REQUIRE(hit.normal.y == Catch::Approx(0.0f).margin(1e-4));
        REQUIRE(hit.normal.w == Catch::Approx(0.0f).margin(1e-4));
    }

    SECTION("Empty scene shows the sky") {
        shared::FrameDesc desc;
        desc.render_extent = glm::uvec2(16, 8);

        for (unsigned y = 0; y < 8; ++y) {
            for (unsigned x = 0; x < 16; ++x) {
                const glm::uvec2 pixel(x, y);
                const shared::Ray ray = kernel::GenerateCameraRay(pixel, desc.render_extent, desc.camera);
                const glm::vec3 sky = kernel::SkyGradient(ray.direction, desc.scene.sky);
                REQUIRE(kernel::ShadePixel(pixel, desc) == glm::vec4(sky, 1.0f));
            }
        }
    }

    SECTION("Multiple samples of the sky average to the sky") {
        shared::FrameDesc desc;
        desc.render_extent = glm::uvec2(4, 4);
        desc.camera.sample_count = 8;

        const glm::uvec2 pixel(1, 3);
        const shared::Ray ray = kernel::GenerateCameraRay(pixel, desc.render_extent, desc.camera);
        const glm::vec3 sky = kernel::SkyGradient(ray.direction, desc.scene.sky);
        const glm::vec4 color = kernel::ShadePixel(pixel, desc);
        REQUIRE(color.r == Catch::Approx(sky.r));
        REQUIRE(color.g == Catch::Approx(sky.g));
        REQUIRE(color.b == Catch::Approx(sky.b));
        REQUIRE(color.a == 1.0f);
    }

    SECTION("Bright emitters clamp to one") {
        TestFrame frame = MakeSphereFrame(glm::uvec2(8, 8));
        frame.spheres[0].radius = 100.0f;
        frame.materials[0].base_color = glm::vec3(0.0f);
        frame.materials[0].emissive_color = glm::vec3(1.0f, 0.5f, 0.2f);
        frame.materials[0].emission_strength = 10.0f;

        REQUIRE(kernel::ShadePixel(glm::uvec2(3, 5), frame.Desc()) == glm::vec4(1.0f));
    }

    SECTION("Shading is deterministic") {
        TestFrame frame = MakeSphereFrame(glm::uvec2(32, 32));
        frame.camera.sample_count = 4;

        for (unsigned i = 0; i < 32; i += 3) {
            const glm::uvec2 pixel(i, 31 - i);
            REQUIRE(kernel::ShadePixel(pixel, frame.Desc()) == kernel::ShadePixel(pixel, frame.Desc()));
        }
    }

    SECTION("Channels stay in range") {
        TestFrame frame = MakeSphereFrame(glm::uvec2(16, 16));
        frame.materials[0].emissive_color = glm::vec3(3.0f);
        frame.materials[0].emission_strength = 2.0f;

        for (unsigned y = 0; y < 16; ++y) {
            for (unsigned x = 0; x < 16; ++x) {
                const glm::vec4 color = kernel::ShadePixel(glm::uvec2(x, y), frame.Desc());
                for (int c = 0; c < 3; ++c) {
                    REQUIRE(color[c] >= 0.0f);
                    REQUIRE(color[c] <= 1.0f);
                }
                REQUIRE(color.a == 1.0f);
            }
        }
    }
}

TEST_CASE("Ray trace entry point", "[kernel][raytrace]") {
    TestFrame frame = MakeSphereFrame(glm::uvec2(4, 3));
    const glm::vec4 sentinel(-1.0f);
    std::vector<glm::vec4> output(12, sentinel);

    SECTION("Writes the shaded pixel at its row-major index") {
        kernel::RayTrace(glm::uvec2(2, 1), frame.Desc(), output);
        REQUIRE(output[6] == kernel::ShadePixel(glm::uvec2(2, 1), frame.Desc()));
        REQUIRE(output[5] == sentinel);
        REQUIRE(output[7] == sentinel);
    }

    SECTION("Pixels outside the extent are ignored") {
        kernel::RayTrace(glm::uvec2(4, 0), frame.Desc(), output);
        kernel::RayTrace(glm::uvec2(0, 3), frame.Desc(), output);
        kernel::RayTrace(glm::uvec2(100, 100), frame.Desc(), output);
        for (const auto& texel : output) {
            REQUIRE(texel == sentinel);
        }
    }

    SECTION("Undersized output is never written past its end") {
        std::vector<glm::vec4> small(4, sentinel);
        kernel::RayTrace(glm::uvec2(3, 2), frame.Desc(), small);
        for (const auto& texel : small) {
            REQUIRE(texel == sentinel);
        }
    }
}
