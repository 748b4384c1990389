#include "lumina-core/lib-core.hpp"
#include "lumina-core/math/math-ray.hpp"

/// Quick reference for doctest macros
/// REQUIRE, REQUIRE_FALSE, CHECK, WARN, CHECK_THROWS_AS(func(), std::exception)
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

namespace lumina
{
    ////////////////////
    //   Math Tests   //
    ////////////////////

    TEST_CASE("transform_coord applies translation, transform_vector does not")
    {
        const float4x4 m = make_trs_matrix({ 1, 2, 3 }, make_rotation_quat_axis_angle({ 0, 1, 0 }, float(LUMINA_HALF_PI)), { 2, 2, 2 });

        const float3 p = transform_coord(m, { 1, 0, 0 });
        CHECK(p.x == doctest::Approx(1.f));
        CHECK(p.y == doctest::Approx(2.f));
        CHECK(p.z == doctest::Approx(1.f)); // +X rotates onto -Z, scaled by 2

        const float3 v = transform_vector(m, { 1, 0, 0 });
        CHECK(v.x == doctest::Approx(0.f).epsilon(0.0001));
        CHECK(v.z == doctest::Approx(-2.f));
    }

    TEST_CASE("normal matrix keeps normals perpendicular under non-uniform scale")
    {
        const float4x4 m = make_scaling_matrix({ 4, 1, 1 });
        const float3 tangent = transform_vector(m, normalize(float3(1, 1, 0)));
        const float3 normal = mul(make_normal_matrix(m), normalize(float3(1, -1, 0)));
        CHECK(dot(tangent, normal) == doctest::Approx(0.f).epsilon(0.0001));
    }

    TEST_CASE("lookat view matrix places the target on the -Z axis")
    {
        const float4x4 view = make_lookat_view_matrix({ 0, 0, 5 }, { 0, 0, 0 }, { 0, 1, 0 });
        const float3 target = transform_coord(view, { 0, 0, 0 });
        CHECK(target.x == doctest::Approx(0.f));
        CHECK(target.y == doctest::Approx(0.f));
        CHECK(target.z == doctest::Approx(-5.f));

        const float4x4 pose = make_lookat_pose_matrix({ 0, 0, 5 }, { 0, 0, 0 });
        const float3 eye = transform_coord(pose, { 0, 0, 0 });
        CHECK(eye.z == doctest::Approx(5.f));
    }

    TEST_CASE("perspective projection maps near and far planes to the clip range")
    {
        const float4x4 proj = make_projection_matrix(to_radians(90.f), 1.f, 0.5f, 10.f);
        CHECK(transform_coord(proj, { 0, 0, -0.5f }).z == doctest::Approx(-1.f));
        CHECK(transform_coord(proj, { 0, 0, -10.f }).z == doctest::Approx(1.f));
        CHECK(transform_coord(proj, { 0.5f, 0, -0.5f }).x == doctest::Approx(1.f));

        const float4x4 ortho = make_orthographic_matrix(-2, 2, -1, 1, 0, 10);
        CHECK(transform_coord(ortho, { 2, 1, 0 }).x == doctest::Approx(1.f));
        CHECK(transform_coord(ortho, { 2, 1, 0 }).y == doctest::Approx(1.f));
        CHECK(transform_coord(ortho, { 0, 0, -10 }).z == doctest::Approx(1.f));
    }

    TEST_CASE("glsl mirror functions")
    {
        CHECK(mix(2.f, 4.f, 0.5f) == doctest::Approx(3.f));
        CHECK(smoothstep(0.f, 1.f, -1.f) == 0.f);
        CHECK(smoothstep(0.f, 1.f, 0.5f) == doctest::Approx(0.5f));
        CHECK(smoothstep(0.f, 1.f, 2.f) == 1.f);
        CHECK(clamp(5, 0, 3) == 3);
        CHECK(wrap_index(-1, 4) == 3);
        CHECK(wrap_index(4, 4) == 0);
        CHECK(wrap_index(2, 4) == 2);
    }

    TEST_CASE("ray intersections")
    {
        const aabb_3d box({ -1, -1, -1 }, { 1, 1, 1 });

        float tmin = 0.f, tmax = 0.f;
        REQUIRE(intersect_ray_box(ray({ -5, 0, 0 }, { 1, 0, 0 }), box, &tmin, &tmax));
        CHECK(tmin == doctest::Approx(4.f));
        CHECK(tmax == doctest::Approx(6.f));
        CHECK_FALSE(intersect_ray_box(ray({ -5, 2, 0 }, { 1, 0, 0 }), box));
        CHECK_FALSE(intersect_ray_box(ray({ -5, 0, 0 }, { -1, 0, 0 }), box));

        float t = 0.f;
        REQUIRE(intersect_ray_triangle(ray({ 0.25f, 0.25f, 1 }, { 0, 0, -1 }), { 0, 0, 0 }, { 1, 0, 0 }, { 0, 1, 0 }, &t));
        CHECK(t == doctest::Approx(1.f));
        CHECK_FALSE(intersect_ray_triangle(ray({ 0.75f, 0.75f, 1 }, { 0, 0, -1 }), { 0, 0, 0 }, { 1, 0, 0 }, { 0, 1, 0 }));
        CHECK_FALSE(intersect_ray_triangle(ray({ 0.25f, 0.25f, 1 }, { 0, 0, 1 }), { 0, 0, 0 }, { 1, 0, 0 }, { 0, 1, 0 }));
    }

    ////////////////////////////
    //   Image Buffer Tests   //
    ////////////////////////////

    TEST_CASE("image_buffer sampling wraps and filters")
    {
        image_buffer<float> image({ 2, 1 }, 4);
        image(0, 0, 0) = 0.f;
        image(0, 1, 0) = 1.f;

        CHECK(sample_nearest(image, { 0.25f, 0.5f }).x == 0.f);
        CHECK(sample_nearest(image, { 0.75f, 0.5f }).x == 1.f);
        CHECK(sample_nearest(image, { 1.25f, 0.5f }).x == 0.f);
        CHECK(sample_nearest(image, { -0.25f, 0.5f }).x == 1.f);

        CHECK(sample_bilinear(image, { 0.5f, 0.5f }).x == doctest::Approx(0.5f));
        CHECK(sample_bilinear(image, { 0.25f, 0.5f }).x == doctest::Approx(0.f));

        image_buffer<float> copy = image;
        copy(0, 0, 0) = 7.f;
        CHECK(image(0, 0, 0) == 0.f);
    }

    ////////////////////////
    //   Geometry Tests   //
    ////////////////////////

    TEST_CASE("procedural meshes and normals")
    {
        geometry plane = make_plane(2.f, 2.f, 2, 3);
        CHECK(plane.vertices.size() == 12);
        CHECK(plane.faces.size() == 12);
        CHECK(compute_bounds(plane).size().x == doctest::Approx(2.f));

        plane.normals.clear();
        compute_normals(plane);
        for (const auto & n : plane.normals) CHECK(n.z == doctest::Approx(1.f));

        const geometry room = make_cube({ 4, 4, 4 }, true);
        REQUIRE(room.faces.size() == 12);
        const uint3 f = room.faces[0];
        const float3 faceNormal = normalize(cross(room.vertices[f.y] - room.vertices[f.x], room.vertices[f.z] - room.vertices[f.x]));
        CHECK(dot(faceNormal, room.normals[f.x]) == doctest::Approx(1.f));
        CHECK(room.normals[f.x].x == doctest::Approx(1.f)); // the -X wall faces into the room
    }

    TEST_CASE("quad expansion and concatenation")
    {
        runtime_mesh_quads quads;
        quads.vertices = { { 0, 0, 0 }, { 1, 0, 0 }, { 1, 1, 0 }, { 0, 1, 0 } };
        quads.quads.push_back({ 0, 1, 2, 3 });

        const runtime_mesh tris = quadmesh_to_trimesh(quads);
        REQUIRE(tris.faces.size() == 2);
        CHECK(tris.faces[1] == uint3(0, 2, 3));

        const geometry both = concatenate_geometry(tris, tris);
        CHECK(both.vertices.size() == 8);
        CHECK(both.faces[2] == uint3(4, 5, 6));

        geometry materials = tris;
        CHECK(count_materials(materials) == 0);
        materials.material = { 2, 2 };
        CHECK(count_materials(materials) == 1);
    }

    //////////////////////////////
    //   Animation Clip Tests   //
    //////////////////////////////

    TEST_CASE("animation clip interpolates and clamps")
    {
        animation_clip clip;
        clip.position.add(0.f, { 0, 0, 0 });
        clip.position.add(2.f, { 4, 0, 0 });
        clip.rotation.add(0.f, { 0, 0, 0, 1 });
        clip.rotation.add(2.f, make_rotation_quat_axis_angle({ 0, 0, 1 }, float(LUMINA_PI)));

        CHECK(clip.duration() == doctest::Approx(2.f));

        const float3 mid = transform_coord(clip.evaluate(1.f), { 0, 0, 0 });
        CHECK(mid.x == doctest::Approx(2.f));

        // halfway through a half turn about Z, +X points along +Y
        const float3 axis = transform_vector(clip.evaluate(1.f), { 1, 0, 0 });
        CHECK(axis.y == doctest::Approx(1.f));

        CHECK(transform_coord(clip.evaluate(-1.f), { 0, 0, 0 }).x == doctest::Approx(0.f));
        CHECK(transform_coord(clip.evaluate(10.f), { 0, 0, 0 }).x == doctest::Approx(4.f));

        CHECK_THROWS_AS(clip.position.add(1.f, { 0, 0, 0 }), std::invalid_argument);
    }

    TEST_CASE("timers")
    {
        simple_cpu_timer timer;
        timer.start();
        timer.stop();
        CHECK(timer.elapsed_ms() >= 0.0);
    }

} // end namespace lumina
