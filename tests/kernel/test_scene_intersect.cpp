#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <hyperray/kernel/scene_intersect.h>

#include <vector>

using namespace hyperray;

namespace {

shared::SceneView MakeView(const std::vector<shared::HyperSphere>& spheres,
                           const std::vector<shared::HyperCuboid>& cuboids,
                           const std::vector<shared::HyperPlane>& planes) {
    shared::SceneView view;
    view.hyper_spheres = spheres;
    view.hyper_cuboids = cuboids;
    view.hyper_planes = planes;
    return view;
}

} // namespace

TEST_CASE("Scene intersection picks the nearest primitive", "[kernel][scene]") {
    const shared::Ray ray{glm::vec4(0.0f, 0.0f, -5.0f, 0.0f), glm::vec4(0.0f, 0.0f, 1.0f, 0.0f)};

    SECTION("Empty scene misses") {
        const std::vector<shared::HyperSphere> spheres;
        const std::vector<shared::HyperCuboid> cuboids;
        const std::vector<shared::HyperPlane> planes;
        const shared::Hit hit = kernel::IntersectScene(ray, MakeView(spheres, cuboids, planes), 0.01f, 1000.0f);
        REQUIRE_FALSE(hit.hit);
    }

    SECTION("Nearest sphere wins regardless of order") {
        std::vector<shared::HyperSphere> spheres(2);
        spheres[0].center = glm::vec4(0.0f, 0.0f, 5.0f, 0.0f);
        spheres[0].material = 0;
        spheres[1].center = glm::vec4(0.0f);
        spheres[1].material = 1;
        const std::vector<shared::HyperCuboid> cuboids;
        const std::vector<shared::HyperPlane> planes;

        const shared::Hit hit = kernel::IntersectScene(ray, MakeView(spheres, cuboids, planes), 0.01f, 1000.0f);
        REQUIRE(hit.hit);
        REQUIRE(hit.material == 1);
        REQUIRE(hit.distance == Catch::Approx(4.0f));
    }

    SECTION("Cuboid in front of a plane") {
        const std::vector<shared::HyperSphere> spheres;
        std::vector<shared::HyperCuboid> cuboids(1);
        cuboids[0].center = glm::vec4(0.0f, 0.0f, -2.0f, 0.0f);
        cuboids[0].half_extents = glm::vec4(0.5f);
        cuboids[0].material = 4;
        std::vector<shared::HyperPlane> planes(1);
        planes[0].point = glm::vec4(0.0f, 0.0f, 3.0f, 0.0f);
        planes[0].normal = glm::vec4(0.0f, 0.0f, -1.0f, 0.0f);
        planes[0].material = 5;

        const shared::Hit hit = kernel::IntersectScene(ray, MakeView(spheres, cuboids, planes), 0.01f, 1000.0f);
        REQUIRE(hit.hit);
        REQUIRE(hit.material == 4);
        REQUIRE(hit.distance == Catch::Approx(2.5f));
    }

    SECTION("Equal distances keep the primitive scanned first") {
        std::vector<shared::HyperSphere> spheres(1);
        spheres[0].radius = 1.0f;
        spheres[0].material = 7;
        std::vector<shared::HyperCuboid> cuboids(1);
        cuboids[0].half_extents = glm::vec4(1.0f);
        cuboids[0].material = 8;
        const std::vector<shared::HyperPlane> planes;

        const shared::Hit hit = kernel::IntersectScene(ray, MakeView(spheres, cuboids, planes), 0.01f, 1000.0f);
        REQUIRE(hit.hit);
        REQUIRE(hit.distance == 4.0f);
        REQUIRE(hit.material == 7);
    }

    SECTION("Primitives past the maximum distance are ignored") {
        std::vector<shared::HyperSphere> spheres(1);
        const std::vector<shared::HyperCuboid> cuboids;
        const std::vector<shared::HyperPlane> planes;

        const shared::Hit hit = kernel::IntersectScene(ray, MakeView(spheres, cuboids, planes), 0.01f, 2.0f);
        REQUIRE_FALSE(hit.hit);
    }
}
