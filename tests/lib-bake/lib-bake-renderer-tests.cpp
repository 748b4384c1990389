#include "bake-test-util.hpp"

#include "spdlog/sinks/ostream_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <fstream>
#include <sstream>
#include <cstdio>

#include <doctest/doctest.h>

namespace lumina
{
    // Job that wants a fixed number of steps, optionally failing on the first one
    class scripted_job final : public bake_job
    {
        std::shared_ptr<const light_scene> scene{ std::make_shared<light_scene>() };

    public:

        int updates{ 0 };
        int steps{ 0 };
        int steps_needed{ 1 };
        bool fail{ false };

        explicit scripted_job(const int stepsNeeded) : steps_needed(stepsNeeded) {}

        void update() override final { updates++; }
        std::shared_ptr<const light_scene> get_light_scene() const override final { return is_complete() ? nullptr : scene; }
        bool is_complete() const override final { return steps >= steps_needed; }
        std::string describe() const override final { return "scripted job"; }

        step_result step(render_device &, const light_scene &) override final
        {
            if (fail) throw std::runtime_error("scripted failure");
            steps++;
            step_result r;
            r.pass_complete = is_complete();
            return r;
        }
    };

    // Gives every view of the n-th probe the color n, starting at 1, so each sampled texel records
    // its position in the sweep. Atlas rasterization and compositing go through the software device.
    class sweep_order_device final : public render_device
    {
        soft_render_device soft;
        image_buffer<float> target;
        int viewCount{ 0 };

    public:

        std::string name() const override final { return "sweep order"; }

        void rasterize_atlas(const std::vector<atlas_raster_vertex> & triangles, image_buffer<float> & out) override final
        {
            soft.rasterize_atlas(triangles, out);
        }

        void begin_probe_target(const int2 & size, const float3 & clearColor) override final
        {
            target = image_buffer<float>(size, 4);
            for (int y = 0; y < size.y; ++y)
            {
                for (int x = 0; x < size.x; ++x)
                {
                    target(y, x, 0) = clearColor.x;
                    target(y, x, 1) = clearColor.y;
                    target(y, x, 2) = clearColor.z;
                }
            }
        }

        void render_light_scene(const light_scene &, const probe_view & view) override final
        {
            const float value = float(viewCount++ / 5 + 1);
            const int4 & r = view.scissor;
            for (int y = r.y; y < r.y + r.w; ++y)
            {
                for (int x = r.x; x < r.x + r.z; ++x)
                {
                    target(y, x, 0) = value;
                    target(y, x, 1) = value;
                    target(y, x, 2) = value;
                    target(y, x, 3) = 1.f;
                }
            }
        }

        void read_probe_target(image_buffer<float> & out) override final { out = target; }

        void composite_layers(const std::vector<composite_layer> & layers, lightmap_texture & out) override final
        {
            soft.composite_layers(layers, out);
        }
    };

    //////////////////////////////
    //   Work Scheduler Tests   //
    //////////////////////////////

    TEST_CASE("work scheduler steps one job per tick in registration order")
    {
        soft_render_device device;
        work_scheduler scheduler;

        auto a = std::make_shared<scripted_job>(2);
        auto b = std::make_shared<scripted_job>(1);
        work_scheduler::scoped_connection ca = scheduler.register_job(a);
        work_scheduler::scoped_connection cb = scheduler.register_job(b);
        CHECK(scheduler.num_jobs() == 2);

        tick_result r = scheduler.tick(device);
        CHECK(r.did_work);
        CHECK(r.steps == 1);
        CHECK(a->steps == 1);
        CHECK(b->steps == 0);
        CHECK(a->updates == 1);
        CHECK(b->updates == 1); // every job is updated, only one is stepped

        scheduler.tick(device);
        CHECK(a->steps == 2);
        CHECK(b->steps == 0);

        scheduler.tick(device);
        CHECK(b->steps == 1);

        r = scheduler.tick(device);
        CHECK_FALSE(r.did_work);
        CHECK(r.steps == 0);

        CHECK_THROWS_AS(scheduler.register_job(nullptr), std::invalid_argument);
    }

    TEST_CASE("work scheduler frame budget")
    {
        soft_render_device device;
        work_scheduler scheduler;

        auto job = std::make_shared<scripted_job>(3);
        auto waiting = std::make_shared<scripted_job>(1);
        work_scheduler::scoped_connection c1 = scheduler.register_job(job);
        work_scheduler::scoped_connection c2 = scheduler.register_job(waiting);

        // a generous budget runs the active job to completion but never moves on to the next one
        const tick_result r = scheduler.tick(device, 10000.0);
        CHECK(r.steps == 3);
        CHECK(job->is_complete());
        CHECK(waiting->steps == 0);
        CHECK(r.elapsed_ms >= 0.0);
    }

    TEST_CASE("work scheduler connections")
    {
        soft_render_device device;
        auto job = std::make_shared<scripted_job>(10);

        work_scheduler::connection outlived;

        {
            work_scheduler scheduler;
            work_scheduler::connection c = scheduler.register_job(job);
            CHECK(c.connected());
            c.disconnect();
            CHECK_FALSE(c.connected());
            CHECK(scheduler.num_jobs() == 0);

            scheduler.tick(device);
            CHECK(job->updates == 0);

            {
                work_scheduler::scoped_connection scoped = scheduler.register_job(job);
                CHECK(scheduler.num_jobs() == 1);
                scheduler.tick(device);
                CHECK(job->steps == 1);
            }
            CHECK(scheduler.num_jobs() == 0);

            // moving a scoped connection transfers ownership of the registration
            work_scheduler::scoped_connection first = scheduler.register_job(job);
            work_scheduler::scoped_connection second = std::move(first);
            CHECK_FALSE(first.connected());
            CHECK(second.connected());
            CHECK(scheduler.num_jobs() == 1);

            outlived = scheduler.register_job(job);
            CHECK(scheduler.num_jobs() == 2);
        }

        // disconnecting after the scheduler is gone is harmless
        CHECK_FALSE(outlived.connected());
        outlived.disconnect();
    }

    TEST_CASE("work scheduler logs and rethrows job failures")
    {
        std::ostringstream stream;
        log::get()->set_bake_logger(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream));

        soft_render_device device;
        work_scheduler scheduler;

        auto job = std::make_shared<scripted_job>(1);
        job->fail = true;
        work_scheduler::scoped_connection c = scheduler.register_job(job);

        CHECK_THROWS_WITH_AS(scheduler.tick(device), "scripted failure", std::runtime_error);
        CHECK(stream.str().find("scripted job failed: scripted failure") != std::string::npos);

        log::get()->set_bake_logger(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    ///////////////////////////////////
    //   Irradiance Renderer Tests   //
    ///////////////////////////////////

    TEST_CASE("irradiance renderer rejects invalid inputs")
    {
        soft_render_device device;
        workbench_stage stage;
        stage.register_item(make_receiver_item());

        const bake_settings settings = make_test_settings();

        auto unmapped = std::make_shared<const workbench>(stage.snapshot());
        CHECK_THROWS_AS(irradiance_renderer(unmapped, std::make_shared<lightmap_texture>(8, 8), settings), std::invalid_argument);

        auto wb = make_mapped_workbench(stage, device, settings);
        CHECK_THROWS_AS(irradiance_renderer(wb, std::make_shared<lightmap_texture>(4, 4), settings), std::invalid_argument);
        CHECK_THROWS_AS(irradiance_renderer(wb, nullptr, settings), std::invalid_argument);
        CHECK_THROWS_AS(irradiance_renderer(nullptr, std::make_shared<lightmap_texture>(8, 8), settings), std::invalid_argument);

        bake_settings noPasses = settings;
        noPasses.pass_count = 0;
        CHECK_THROWS_AS(irradiance_renderer(wb, std::make_shared<lightmap_texture>(8, 8), noPasses), std::invalid_argument);
    }

    TEST_CASE("irradiance renderer sweeps the atlas in bounded steps")
    {
        soft_render_device device;
        workbench_stage stage;
        stage.register_item(make_receiver_item());

        bake_settings settings = make_test_settings();
        settings.pass_count = 1;
        auto wb = make_mapped_workbench(stage, device, settings);

        irradiance_renderer renderer(wb, std::make_shared<lightmap_texture>(8, 8), settings);
        CHECK(renderer.get_phase() == renderer_phase::idle);
        CHECK(renderer.get_light_scene() == nullptr);

        renderer.update();
        CHECK(renderer.get_phase() == renderer_phase::texel_sweep);
        CHECK(renderer.get_pass_index() == 0);

        const auto scene = renderer.get_light_scene();
        REQUIRE(scene != nullptr);

        // four probes per batch: the first step ends right after texel (5, 2)
        step_result r = renderer.step(device, *scene);
        CHECK(r.probes_rendered == 4);
        CHECK(r.texels_examined == 22);
        CHECK_FALSE(r.pass_complete);

        size_t probes = r.probes_rendered;
        size_t examined = r.texels_examined;
        int stepCount = 1;

        while (!r.pass_complete && stepCount < 100)
        {
            r = renderer.step(device, *scene);
            probes += r.probes_rendered;
            examined += r.texels_examined;
            stepCount++;
        }

        CHECK(r.pass_complete);
        CHECK(stepCount == 5);
        CHECK(probes == 16);
        CHECK(examined == 64);
        CHECK(renderer.get_phase() == renderer_phase::pass_complete);
        CHECK(renderer.get_light_scene() == nullptr);

        // stepping outside the sweep does nothing
        r = renderer.step(device, *scene);
        CHECK(r.texels_examined == 0);

        renderer.update();
        CHECK(renderer.is_complete());
        CHECK(std::string(to_string(renderer.get_phase())) == "done");
    }

    TEST_CASE("irradiance renderer texel budget bounds a single step")
    {
        soft_render_device device;
        workbench_stage stage;
        stage.register_item(make_receiver_item());

        bake_settings settings = make_test_settings();
        settings.texel_budget = 8;
        auto wb = make_mapped_workbench(stage, device, settings);

        irradiance_renderer renderer(wb, std::make_shared<lightmap_texture>(8, 8), settings);
        renderer.update();

        // the first row is empty
        const step_result r = renderer.step(device, *renderer.get_light_scene());
        CHECK(r.texels_examined == 8);
        CHECK(r.probes_rendered == 0);
        CHECK(renderer.get_texel_counter() == 8);
    }

    TEST_CASE("irradiance renderer bakes sky light and bleeds across chart seams")
    {
        soft_render_device device;
        workbench_stage stage;
        stage.register_item(make_receiver_item());

        bake_settings settings = make_test_settings();
        settings.sky_color = { 1, 1, 1 };
        settings.pass_count = 1;
        auto wb = make_mapped_workbench(stage, device, settings);

        auto output = std::make_shared<lightmap_texture>(8, 8);
        auto renderer = std::make_shared<irradiance_renderer>(wb, output, settings);

        work_scheduler scheduler;
        work_scheduler::scoped_connection c = scheduler.register_job(renderer);
        REQUIRE(run_job(scheduler, device, *renderer) > 0);

        // the quad never sees itself, so every probe averages the sky
        for (int y = 1; y <= 6; ++y)
        {
            for (int x = 1; x <= 6; ++x)
            {
                const float4 t = output->get_texel(texel_index(x, y));
                CHECK(t.x == doctest::Approx(1.f));
                CHECK(t.z == doctest::Approx(1.f));
                CHECK(t.w == 1.f);
            }
        }

        // untouched texels keep the base layer test pattern
        const float4 corner = output->get_texel(texel_index(0, 0));
        CHECK(corner.x == doctest::Approx(0.2f));
        CHECK(corner.z == doctest::Approx(0.8f));
        CHECK(corner.w == 0.f);
        CHECK(output->get_texel(texel_index(7, 7)).x == doctest::Approx(0.2f));
        CHECK(output->get_texel(texel_index(0, 3)).w == 0.f);
    }

    TEST_CASE("irradiance renderer bleed order between neighboring charts")
    {
        sweep_order_device device;
        workbench_stage stage;

        auto register_chart = [&](const float2 & uvMin, const float2 & uvMax)
        {
            workbench_item item;
            item.mesh = std::make_shared<runtime_mesh>(with_atlas_rect(make_test_quad(), uvMin, uvMax));
            stage.register_item(item);
        };

        register_chart({ 0.125f, 0.125f }, { 0.375f, 0.375f });   // texels x 1..2, y 1..2
        register_chart({ 0.5f, 0.125f }, { 0.75f, 0.375f });      // texels x 4..5, y 1..2
        register_chart({ 0.75f, 0.5f }, { 1.f, 0.75f });          // texels x 6..7, y 4..5

        bake_settings settings = make_test_settings();
        settings.pass_count = 1;
        auto wb = make_mapped_workbench(stage, device, settings);
        REQUIRE(wb->atlas.count_populated_texels() == 12);

        auto output = std::make_shared<lightmap_texture>(8, 8);
        auto renderer = std::make_shared<irradiance_renderer>(wb, output, settings);

        work_scheduler scheduler;
        work_scheduler::scoped_connection c = scheduler.register_job(renderer);
        REQUIRE(run_job(scheduler, device, *renderer) > 0);

        auto value = [&](const int x, const int y) { return output->get_texel(texel_index(x, y)).x; };

        // sampled texels hold their row-major sweep position
        CHECK(value(1, 1) == doctest::Approx(1.f));
        CHECK(value(2, 2) == doctest::Approx(6.f));
        CHECK(value(4, 2) == doctest::Approx(7.f));
        CHECK(value(5, 2) == doctest::Approx(8.f));
        CHECK(value(6, 4) == doctest::Approx(9.f));
        CHECK(value(7, 5) == doctest::Approx(12.f));

        // (3, 2): diagonal from (2, 1) first, then cardinal from (2, 2) and (4, 2); the last cardinal writer wins
        CHECK(value(3, 2) == doctest::Approx(7.f));
        CHECK(value(3, 2) == doctest::Approx(value(4, 2)));

        // (3, 3) has no populated cardinal neighbor; (2, 2) reaches it before (4, 2) and is kept
        CHECK(value(3, 3) == doctest::Approx(6.f));

        // a cardinal neighbor replaces an earlier diagonal fill
        CHECK(value(6, 3) == doctest::Approx(value(6, 4)));
        CHECK(value(6, 2) == doctest::Approx(value(5, 2)));

        // outside neighbors of boundary texels copy the boundary texel
        CHECK(value(0, 1) == doctest::Approx(value(1, 1)));
        CHECK(value(1, 0) == doctest::Approx(value(1, 1)));
        CHECK(value(0, 2) == doctest::Approx(value(1, 2)));

        // neighbors past the right edge wrap to column 0
        CHECK(value(0, 4) == doctest::Approx(value(7, 4)));
        CHECK(value(0, 5) == doctest::Approx(value(7, 5)));

        for (const int2 & t : { int2(3, 2), int2(3, 3), int2(6, 3), int2(0, 4), int2(0, 5) })
        {
            CHECK(output->get_texel(texel_index(t.x, t.y)).w == 1.f);
        }

        // texels away from every chart keep the test pattern
        CHECK(output->get_texel(texel_index(3, 6)).w == 0.f);
    }

    TEST_CASE("irradiance renderer accumulates bounce passes")
    {
        soft_render_device device;
        workbench_stage stage;
        stage.register_item(make_receiver_item());

        bake_settings settings = make_test_settings();
        settings.sky_color = { 1, 1, 1 };
        settings.pass_count = 2;
        auto wb = make_mapped_workbench(stage, device, settings);

        auto output = std::make_shared<lightmap_texture>(8, 8);
        auto renderer = std::make_shared<irradiance_renderer>(wb, output, settings);

        work_scheduler scheduler;
        work_scheduler::scoped_connection c = scheduler.register_job(renderer);

        // (pass, texel counter) never moves backwards
        int lastPass = -1;
        size_t lastCounter = 0;
        for (int i = 0; i < 1000 && !renderer->is_complete(); ++i)
        {
            scheduler.tick(device);
            const int pass = renderer->get_pass_index();
            const size_t counter = renderer->get_texel_counter();
            CHECK(pass >= lastPass);
            if (pass == lastPass)
            {
                CHECK(counter >= lastCounter);
            }
            lastPass = pass;
            lastCounter = counter;
        }

        REQUIRE(renderer->is_complete());
        CHECK(renderer->get_pass_index() == 1);

        for (int y = 1; y <= 6; ++y)
        {
            for (int x = 1; x <= 6; ++x)
            {
                CHECK(output->get_texel(texel_index(x, y)).y == doctest::Approx(2.f));
                CHECK(renderer->get_pass_output()->get_texel(texel_index(x, y)).y == doctest::Approx(1.f));
                CHECK(renderer->get_previous_output()->get_texel(texel_index(x, y)).y == doctest::Approx(1.f));
            }
        }

        CHECK(output->get_texel(texel_index(0, 0)).x == doctest::Approx(0.2f));
    }

    TEST_CASE("irradiance renderer output is deterministic")
    {
        soft_render_device device;
        workbench_stage stage;
        stage.register_item(make_receiver_item());
        stage.register_item(make_lamp_item({}));

        bake_settings settings = make_test_settings();
        auto wb = make_mapped_workbench(stage, device, settings);

        auto first = std::make_shared<irradiance_renderer>(wb, std::make_shared<lightmap_texture>(8, 8), settings);
        auto second = std::make_shared<irradiance_renderer>(wb, std::make_shared<lightmap_texture>(8, 8), settings);

        work_scheduler scheduler;
        {
            work_scheduler::scoped_connection c = scheduler.register_job(first);
            REQUIRE(run_job(scheduler, device, *first) > 0);
        }
        {
            work_scheduler::scoped_connection c = scheduler.register_job(second);
            REQUIRE(run_job(scheduler, device, *second) > 0);
        }

        const auto a = first->get_output();
        const auto b = second->get_output();
        for (size_t i = 0; i < a->num_texels(); ++i)
        {
            CHECK(a->get_texel(i) == b->get_texel(i));
        }

        // the lamp overhead lights the receiver
        CHECK(a->get_texel(texel_index(3, 3)).x > 0.f);
    }

    TEST_CASE("irradiance renderer bakes a directionally lit room on a 64x64 atlas")
    {
        soft_render_device device;
        workbench_stage stage;
        stage.register_item(make_receiver_item());   // texels 16..47 on both axes

        // a grey ceiling facing the receiver, lit from below
        workbench_item ceiling;
        ceiling.mesh = std::make_shared<runtime_mesh>(make_test_quad(4.f, 1.f, true));
        ceiling.material.albedo = { 0.5f, 0.5f, 0.5f };
        ceiling.needs_lightmap = false;
        stage.register_item(ceiling);

        workbench_light up;
        up.world_matrix = make_rotation_matrix({ 1, 0, 0 }, float(LUMINA_PI));   // shines along +Z
        up.cast_shadow = false;
        stage.register_light(up);

        bake_settings settings = make_test_settings();
        settings.atlas_width = 64;
        settings.atlas_height = 64;
        settings.pass_count = 2;
        settings.texel_budget = 256;
        auto wb = make_mapped_workbench(stage, device, settings);
        REQUIRE(wb->atlas.count_populated_texels() == 32 * 32);

        auto output = std::make_shared<lightmap_texture>(64, 64);
        auto renderer = std::make_shared<irradiance_renderer>(wb, output, settings);

        work_scheduler scheduler;
        work_scheduler::scoped_connection c = scheduler.register_job(renderer);
        REQUIRE(run_job(scheduler, device, *renderer, 100000) > 0);
        CHECK(renderer->is_complete());
        CHECK(renderer->get_pass_index() == 1);

        // previous output holds the first pass, which started from zero
        const auto firstPass = renderer->get_previous_output();

        for (int y = 16; y < 48; ++y)
        {
            for (int x = 16; x < 48; ++x)
            {
                const size_t i = texel_index(x, y, 64);
                const float4 lit = firstPass->get_texel(i);
                const float4 total = output->get_texel(i);

                REQUIRE(lit.w == 1.f);
                REQUIRE(lit.x > 0.f);
                REQUIRE(lit.y > 0.f);
                REQUIRE(lit.z > 0.f);

                REQUIRE(total.w == 1.f);
                REQUIRE(total.x >= lit.x);
            }
        }
    }

    TEST_CASE("irradiance renderer reports corrupt atlas texels")
    {
        soft_render_device device;
        workbench_stage stage;
        stage.register_item(make_receiver_item());

        const bake_settings settings = make_test_settings();

        workbench wb = stage.snapshot();
        map_workbench_atlas(device, wb, settings.atlas_width, settings.atlas_height);
        wb.atlas.data(3, 3, 2) = encode_atlas_face(7, 0); // no such item
        auto corrupt = std::make_shared<const workbench>(std::move(wb));

        auto renderer = std::make_shared<irradiance_renderer>(corrupt, std::make_shared<lightmap_texture>(8, 8), settings);

        work_scheduler scheduler;
        work_scheduler::scoped_connection c = scheduler.register_job(renderer);
        CHECK_THROWS_AS(run_job(scheduler, device, *renderer), std::runtime_error);
    }

    //////////////////////////
    //   Compositor Tests   //
    //////////////////////////

    TEST_CASE("compositor layers and multipliers")
    {
        soft_render_device device;
        compositor comp(2, 2);
        CHECK(comp.size() == int2(2, 2));

        const factor_name a = std::string("a");
        const factor_name b = std::string("b");

        CHECK(comp.get_multiplier({}) == 1.f);
        CHECK(comp.get_multiplier(a) == 0.f);
        CHECK(comp.get_layer_texture({})->get_texel(0).x == doctest::Approx(test_pattern_texel(0, 0).x));

        auto layerA = comp.get_layer_texture(a);
        auto layerB = comp.get_layer_texture(b);
        CHECK(layerA->get_texel(0).x == 0.f);
        CHECK(comp.get_factor_names() == std::vector<std::string>{ "a", "b" });
        CHECK(comp.get_layer_texture(a) == layerA);

        for (size_t i = 0; i < 4; ++i)
        {
            layerA->set_texel(i, { 1, 2, 3, 1 });
            layerB->set_texel(i, { 0.5f, 0.5f, 0.5f, 1 });
        }
        layerA->mark_dirty();
        layerB->mark_dirty();

        comp.set_multiplier({}, 0.f);
        comp.set_multiplier(a, 2.f);
        comp.render(device);

        float4 t = comp.get_output()->get_texel(3);
        CHECK(t.x == doctest::Approx(2.f));
        CHECK(t.y == doctest::Approx(4.f));
        CHECK(t.z == doctest::Approx(6.f));
        CHECK(t.w == 1.f);

        comp.set_multiplier(b, 4.f);
        comp.render(device);
        t = comp.get_output()->get_texel(3);
        CHECK(t.x == doctest::Approx(4.f));
        CHECK(t.z == doctest::Approx(8.f));

        // the sum is linear in the multipliers and leaves the layers untouched
        comp.set_multiplier(a, 4.f);
        comp.set_multiplier(b, 8.f);
        comp.render(device);
        CHECK(comp.get_output()->get_texel(0).x == doctest::Approx(8.f));
        CHECK(layerA->get_texel(0).x == 1.f);

        CHECK(comp.get_multiplier(std::string("missing")) == 0.f);
    }

    ///////////////////////////
    //   Factor Bake Tests   //
    ///////////////////////////

    TEST_CASE("factor bake sequence bakes the base layer and then each factor")
    {
        soft_render_device device;
        workbench_stage stage;
        stage.register_item(make_receiver_item());
        stage.register_item(make_lamp_item(std::string("lamp")));

        workbench_light sun;
        sun.factor = std::string("sun");
        stage.register_light(sun);

        bake_settings settings = make_test_settings();
        settings.pass_count = 1;
        auto wb = make_mapped_workbench(stage, device, settings);
        auto comp = std::make_shared<compositor>(8, 8);

        auto sequence = std::make_shared<factor_bake_sequence>(wb, comp, settings);
        REQUIRE(sequence->get_order().size() == 3);
        CHECK_FALSE(sequence->get_order()[0].has_value());
        CHECK(*sequence->get_order()[1] == "lamp");
        CHECK(*sequence->get_order()[2] == "sun");
        CHECK(sequence->get_current_renderer() == nullptr);

        work_scheduler scheduler;
        work_scheduler::scoped_connection c = scheduler.register_job(sequence);

        std::vector<std::string> seen;
        for (int i = 0; i < 1000 && !sequence->is_complete(); ++i)
        {
            scheduler.tick(device);
            if (const irradiance_renderer * r = sequence->get_current_renderer())
            {
                const std::string name = to_string(r->get_factor());
                if (seen.empty() || seen.back() != name) seen.push_back(name);
            }
        }

        REQUIRE(sequence->is_complete());
        CHECK(sequence->get_current_renderer() == nullptr);
        CHECK(seen == std::vector<std::string>{ "(base)", "lamp", "sun" });
        CHECK(comp->get_factor_names() == std::vector<std::string>{ "lamp", "sun" });

        // emission only lands in the layer of the factor that owns it
        const size_t texel = texel_index(3, 3);
        CHECK(comp->get_layer_texture({})->get_texel(texel).x == 0.f);
        CHECK(comp->get_layer_texture(std::string("lamp"))->get_texel(texel).x > 0.f);
        CHECK(comp->get_layer_texture(std::string("sun"))->get_texel(texel).x == 0.f);
    }

    TEST_CASE("keyframe bake renders one layer per time value")
    {
        soft_render_device device;
        workbench_stage stage;
        stage.register_item(make_receiver_item());

        auto clip = std::make_shared<animation_clip>();
        clip->position.add(0.f, { 0, 0, 0 });
        clip->position.add(1.f, { 100, 0, 0 });

        workbench_item lamp = make_lamp_item({});
        lamp.animation = clip;
        stage.register_item(lamp);

        bake_settings settings = make_test_settings();
        settings.pass_count = 1;
        auto wb = make_mapped_workbench(stage, device, settings);

        CHECK_THROWS_AS(keyframe_bake(wb, settings, {}, {}), std::invalid_argument);

        auto bake = std::make_shared<keyframe_bake>(wb, settings, factor_name(), std::vector<float>{ 0.f, 1.f });
        REQUIRE(bake->num_keyframes() == 2);
        CHECK(bake->get_time(1) == 1.f);
        CHECK(bake->get_output(0) != bake->get_output(1));

        bake->update();
        light_scene foreign;
        CHECK_THROWS_AS(bake->step(device, foreign), std::runtime_error);

        work_scheduler scheduler;
        work_scheduler::scoped_connection c = scheduler.register_job(bake);
        REQUIRE(run_job(scheduler, device, *bake) >= 0);
        CHECK(bake->is_complete());

        // the lamp is overhead at t = 0 and far away at t = 1
        const size_t texel = texel_index(3, 3);
        CHECK(bake->get_output(0)->get_texel(texel).x > 0.f);
        CHECK(bake->get_output(1)->get_texel(texel).x == 0.f);
        CHECK(bake->get_output(1)->get_texel(texel).w == 1.f);
    }

    //////////////////////////////
    //   Lightmap Baker Tests   //
    //////////////////////////////

    TEST_CASE("lightmap baker runs and restarts bakes")
    {
        bake_settings invalid = make_test_settings();
        invalid.probe_size = 3;
        CHECK_THROWS_AS(lightmap_baker{ invalid }, std::invalid_argument);

        soft_render_device device;

        bake_settings settings = make_test_settings();
        settings.pass_count = 1;
        lightmap_baker baker(settings);
        CHECK_FALSE(baker.is_started());
        CHECK_FALSE(baker.is_complete());

        baker.get_stage().register_item(make_receiver_item());
        baker.get_stage().register_item(make_lamp_item(std::string("lamp")));

        baker.start(device);
        REQUIRE(baker.is_started());
        CHECK(baker.get_workbench()->id == 1);
        CHECK(baker.get_workbench()->atlas.count_populated_texels() == 16);
        CHECK(baker.get_scheduler().num_jobs() == 1);

        const auto firstCompositor = baker.get_compositor();
        baker.tick(device);

        // starting again discards the running bake
        baker.start(device);
        CHECK(baker.get_workbench()->id == 2);
        CHECK(baker.get_scheduler().num_jobs() == 1);
        CHECK(baker.get_compositor() != firstCompositor);
        CHECK(baker.get_sequence()->get_order().size() == 2);

        for (int i = 0; i < 1000 && !baker.is_complete(); ++i) baker.tick(device);
        REQUIRE(baker.is_complete());

        const size_t texel = texel_index(3, 3);
        const auto output = baker.get_compositor()->get_output();
        CHECK(output->get_texel(texel).x == 0.f);

        // factor multipliers apply on the next composite without re-baking
        baker.get_compositor()->set_multiplier(std::string("lamp"), 1.f);
        const tick_result r = baker.tick(device);
        CHECK_FALSE(r.did_work);
        CHECK(output->get_texel(texel).x > 0.f);
        CHECK(output->get_texel(texel).w == 1.f);
    }

    //////////////////////
    //   Export Tests   //
    //////////////////////

    namespace
    {
        std::streamoff file_size(const std::string & path)
        {
            std::ifstream file(path, std::ios::binary | std::ios::ate);
            if (!file.is_open()) return -1;
            return static_cast<std::streamoff>(file.tellg());
        }
    }

    TEST_CASE("lightmap export writes hdr and png files")
    {
        lightmap_texture texture(4, 4);
        texture.fill_test_pattern();

        const std::string hdrPath = "lumina-test-export.hdr";
        const std::string pngPath = "lumina-test-export.png";

        export_lightmap_hdr(texture, hdrPath);
        export_lightmap_png(texture, pngPath, 2.f);

        CHECK(file_size(hdrPath) > 0);
        CHECK(file_size(pngPath) > 0);

        std::remove(hdrPath.c_str());
        std::remove(pngPath.c_str());

        CHECK_THROWS_AS(export_lightmap_png(texture, "lumina-missing-directory/out.png"), std::runtime_error);
        CHECK_THROWS_AS(export_lightmap_hdr(texture, "lumina-missing-directory/out.hdr"), std::runtime_error);
    }

} // end namespace lumina
