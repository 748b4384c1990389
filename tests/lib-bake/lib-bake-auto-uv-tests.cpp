#include "bake-test-util.hpp"

#include <doctest/doctest.h>

namespace lumina
{
    namespace
    {
        bool boxes_overlap(const layout_box & a, const layout_box & b)
        {
            return a.x < b.x + b.w && b.x < a.x + a.w && a.y < b.y + b.h && b.y < a.y + a.h;
        }

        // Texel-space bounds of the atlas coordinates of vertices [first, first + count)
        layout_box uv_bounds_in_texels(const runtime_mesh & mesh, const size_t first, const size_t count, const int2 & atlasSize)
        {
            float2 lo = mesh.texcoord1[first];
            float2 hi = lo;
            for (size_t i = first; i < first + count; ++i)
            {
                lo = linalg::min(lo, mesh.texcoord1[i]);
                hi = linalg::max(hi, mesh.texcoord1[i]);
            }

            layout_box b;
            b.x = int(std::round(lo.x * atlasSize.x));
            b.y = int(std::round(lo.y * atlasSize.y));
            b.w = int(std::round(hi.x * atlasSize.x)) - b.x;
            b.h = int(std::round(hi.y * atlasSize.y)) - b.y;
            return b;
        }
    }

    //////////////////////////
    //   Box Packing Tests   //
    //////////////////////////

    TEST_CASE("layout box packing")
    {
        std::vector<layout_box> none;
        CHECK(pack_layout_boxes(none) == int2(0, 0));

        std::vector<layout_box> single(1);
        single[0].w = 5;
        single[0].h = 3;
        CHECK(pack_layout_boxes(single) == int2(5, 3));
        CHECK(single[0].x == 0);
        CHECK(single[0].y == 0);

        // six equal boxes fill rows two at a time
        std::vector<layout_box> squares(6);
        for (auto & b : squares) { b.w = 4; b.h = 4; }
        CHECK(pack_layout_boxes(squares) == int2(8, 12));

        const int sizes[][2] = { { 3, 7 }, { 5, 2 }, { 4, 4 }, { 2, 6 }, { 6, 1 }, { 1, 1 }, { 3, 3 }, { 8, 2 } };
        std::vector<layout_box> mixed;
        for (const auto & s : sizes)
        {
            layout_box b;
            b.w = s[0];
            b.h = s[1];
            mixed.push_back(b);
        }

        const int2 used = pack_layout_boxes(mixed);
        for (size_t i = 0; i < mixed.size(); ++i)
        {
            CHECK(mixed[i].w == sizes[i][0]); // sizes are never changed
            CHECK(mixed[i].x >= 0);
            CHECK(mixed[i].y >= 0);
            CHECK(mixed[i].x + mixed[i].w <= used.x);
            CHECK(mixed[i].y + mixed[i].h <= used.y);

            for (size_t j = i + 1; j < mixed.size(); ++j)
            {
                CHECK_FALSE(boxes_overlap(mixed[i], mixed[j]));
            }
        }
    }

    //////////////////////
    //   Auto-UV Tests   //
    //////////////////////

    TEST_CASE("auto-UV lays out one chart per cube side")
    {
        runtime_mesh cube = make_cube();
        auto_uv2_layout({ &cube }, 16, 16, 8.f);

        REQUIRE(cube.texcoord1.size() == cube.vertices.size());
        for (const auto & uv : cube.texcoord1)
        {
            CHECK(uv.x >= 0.f);
            CHECK(uv.x <= 1.f);
            CHECK(uv.y >= 0.f);
            CHECK(uv.y <= 1.f);
        }

        // each side covers 1 world unit, i.e. 2 texels at 0.5 units per texel, and charts never share texels
        std::vector<layout_box> charts;
        for (size_t side = 0; side < 6; ++side)
        {
            const layout_box b = uv_bounds_in_texels(cube, side * 4, 4, { 16, 16 });
            CHECK(b.w == 2);
            CHECK(b.h == 2);
            charts.push_back(b);
        }

        for (size_t i = 0; i < charts.size(); ++i)
        {
            for (size_t j = i + 1; j < charts.size(); ++j)
            {
                CHECK_FALSE(boxes_overlap(charts[i], charts[j]));
            }
        }

        // the result is usable as a lightmapped item
        workbench_item item;
        item.mesh = std::make_shared<runtime_mesh>(cube);
        CHECK_NOTHROW(validate_workbench_item(item));
    }

    TEST_CASE("auto-UV keeps connected faces in one chart")
    {
        runtime_mesh plane = make_plane(2.f, 2.f, 2, 2);
        auto_uv2_layout({ &plane }, 8, 8, 8.f);

        // a 2x2 unit chart at one unit per texel, inset by the one texel margin
        float2 lo = plane.texcoord1[0];
        float2 hi = lo;
        for (const auto & uv : plane.texcoord1)
        {
            lo = linalg::min(lo, uv);
            hi = linalg::max(hi, uv);
        }

        CHECK(lo.x == doctest::Approx(1.f / 8.f));
        CHECK(lo.y == doctest::Approx(1.f / 8.f));
        CHECK(hi.x == doctest::Approx(3.f / 8.f));
        CHECK(hi.y == doctest::Approx(3.f / 8.f));

        // the center vertex lands in the middle of the chart
        CHECK(plane.texcoord1[4].x == doctest::Approx(2.f / 8.f));
        CHECK(plane.texcoord1[4].y == doctest::Approx(2.f / 8.f));
    }

    TEST_CASE("auto-UV packs several meshes into one atlas")
    {
        runtime_mesh a = make_plane(2.f, 2.f);
        runtime_mesh b = make_plane(4.f, 2.f);
        auto_uv2_layout({ &a, &b }, 16, 16, 16.f);

        REQUIRE(a.texcoord1.size() == 4);
        REQUIRE(b.texcoord1.size() == 4);

        const layout_box boxA = uv_bounds_in_texels(a, 0, 4, { 16, 16 });
        const layout_box boxB = uv_bounds_in_texels(b, 0, 4, { 16, 16 });
        CHECK(boxA.w * boxA.h == 4);
        CHECK(boxB.w * boxB.h == 8);
        CHECK_FALSE(boxes_overlap(boxA, boxB));
    }

    TEST_CASE("auto-UV failures leave meshes untouched")
    {
        runtime_mesh cube = make_cube();

        // needs 8x12 texels at this density
        CHECK_THROWS_AS(auto_uv2_layout({ &cube }, 8, 8, 4.f), std::runtime_error);
        CHECK(cube.texcoord1.empty());

        runtime_mesh existing = with_atlas_rect(make_test_quad(), { 0, 0 }, { 1, 1 });
        CHECK_THROWS_WITH_AS(auto_uv2_layout({ &cube, &existing }, 16, 16, 8.f), "uv2 attribute already exists", std::invalid_argument);
        CHECK(cube.texcoord1.empty());

        runtime_mesh noFaces = make_test_quad();
        noFaces.faces.clear();
        CHECK_THROWS_AS(auto_uv2_layout({ &noFaces }, 16, 16, 8.f), std::invalid_argument);

        runtime_mesh noNormals = make_test_quad();
        noNormals.normals.clear();
        CHECK_THROWS_AS(auto_uv2_layout({ &noNormals }, 16, 16, 8.f), std::invalid_argument);

        CHECK_THROWS_AS(auto_uv2_layout({ nullptr }, 16, 16, 8.f), std::invalid_argument);
        CHECK_THROWS_AS(auto_uv2_layout({ &cube }, 0, 16, 8.f), std::invalid_argument);
        CHECK_THROWS_AS(auto_uv2_layout({ &cube }, 16, 16, 0.f), std::invalid_argument);
    }

    /////////////////////////
    //   Auto-Index Tests   //
    /////////////////////////

    TEST_CASE("auto-index connects identical corners of a triangle soup")
    {
        const float3 a = { 0, 0, 0 }, b = { 1, 0, 0 }, c = { 1, 1, 0 }, d = { 0, 1, 0 };
        const float3 n = { 0, 0, 1 };

        runtime_mesh soup;
        soup.vertices = { a, b, c, a, c, d };
        soup.normals = { n, n, n, n, n, n };

        auto_index(soup);
        REQUIRE(soup.faces.size() == 2);
        CHECK(soup.faces[0] == uint3(0, 1, 2));
        CHECK(soup.faces[1] == uint3(0, 2, 5));
        CHECK(soup.vertices.size() == 6);

        CHECK_THROWS_AS(auto_index(soup), std::invalid_argument);

        // a corner with a different normal stays separate
        runtime_mesh creased;
        creased.vertices = { a, b, c, a, c, d };
        creased.normals = { n, n, n, { 0, 1, 0 }, n, n };
        auto_index(creased);
        CHECK(creased.faces[1] == uint3(3, 2, 5));

        runtime_mesh broken;
        broken.vertices = { a, b, c, d };
        CHECK_THROWS_AS(auto_index(broken), std::invalid_argument);
    }

} // end namespace lumina
