// Bakes a small Cornell-style room and writes the composited lightmap plus every layer to disk.
//
// usage: lightmap-bake [--soft] [--config settings.json] [--save-config settings.json]
//                      [--out prefix] [--exposure 1.0] [--accent 1.0] [--max-ticks 1000000]

#include "lumina-core/lib-core.hpp"
#include "lumina-bake/lib-bake.hpp"
#include "lumina-gfx-gl/gl-context.hpp"
#include "lumina-gfx-gl/gl-render-device.hpp"

#include <cstdlib>
#include <iostream>

using namespace lumina;

struct app_options
{
    bool soft{ false };
    std::string config_path;
    std::string save_config_path;
    std::string output_prefix{ "lightmap" };
    float exposure{ 1.f };
    float accent{ 1.f };
    uint64_t max_ticks{ 1000000 };
};

static app_options parse_options(int argc, char * argv[])
{
    app_options options;

    auto next_value = [&](int & i) -> std::string
    {
        if (i + 1 >= argc) throw std::invalid_argument(std::string("missing value for ") + argv[i]);
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--soft") options.soft = true;
        else if (arg == "--config") options.config_path = next_value(i);
        else if (arg == "--save-config") options.save_config_path = next_value(i);
        else if (arg == "--out") options.output_prefix = next_value(i);
        else if (arg == "--exposure") options.exposure = std::stof(next_value(i));
        else if (arg == "--accent") options.accent = std::stof(next_value(i));
        else if (arg == "--max-ticks") options.max_ticks = std::stoull(next_value(i));
        else throw std::invalid_argument("unknown argument: " + arg);
    }

    return options;
}

static workbench_item make_wall(const std::shared_ptr<const runtime_mesh> & mesh, const float4x4 & world, const float3 & albedo)
{
    workbench_item item;
    item.mesh = mesh;
    item.world_matrix = world;
    item.material.albedo = albedo;
    return item;
}

// Walls, floor and ceiling of a 4 unit room open toward +Z, a white block and a warm accent panel
static void stage_cornell_room(workbench_stage & stage, const bake_settings & settings)
{
    if (settings.auto_uv_world_width <= 0.f) throw std::runtime_error("the demo room needs auto_uv_world_width > 0");

    const float half = 2.f;
    const float quarter = float(LUMINA_PI) / 2.f;

    std::vector<std::shared_ptr<runtime_mesh>> meshes;
    for (int i = 0; i < 5; ++i) meshes.push_back(std::make_shared<runtime_mesh>(make_plane(4.f, 4.f)));
    meshes.push_back(std::make_shared<runtime_mesh>(make_cube({ 1.f, 1.2f, 1.f })));

    std::vector<runtime_mesh *> layout;
    for (auto & m : meshes) layout.push_back(m.get());
    auto_uv2_layout(layout, settings.atlas_width, settings.atlas_height, settings.auto_uv_world_width);

    const float3 white = { 0.8f, 0.8f, 0.8f };

    stage.register_item(make_wall(meshes[0], mul(make_translation_matrix({ 0, -half, 0 }), make_rotation_matrix({ 1, 0, 0 }, -quarter)), white));   // floor
    stage.register_item(make_wall(meshes[1], mul(make_translation_matrix({ 0, +half, 0 }), make_rotation_matrix({ 1, 0, 0 }, +quarter)), white));   // ceiling
    stage.register_item(make_wall(meshes[2], make_translation_matrix({ 0, 0, -half }), white));                                                     // back
    stage.register_item(make_wall(meshes[3], mul(make_translation_matrix({ -half, 0, 0 }), make_rotation_matrix({ 0, 1, 0 }, +quarter)), { 0.8f, 0.1f, 0.1f }));
    stage.register_item(make_wall(meshes[4], mul(make_translation_matrix({ +half, 0, 0 }), make_rotation_matrix({ 0, 1, 0 }, -quarter)), { 0.1f, 0.8f, 0.1f }));
    stage.register_item(make_wall(meshes[5], make_translation_matrix({ 0.5f, -half + 0.6f, -0.5f }), white));

    workbench_item panel;
    panel.mesh = std::make_shared<runtime_mesh>(make_plane(0.6f, 0.6f));
    panel.world_matrix = mul(make_translation_matrix({ -half + 0.01f, 0.5f, 0.f }), make_rotation_matrix({ 0, 1, 0 }, +quarter));
    panel.material.albedo = { 0, 0, 0 };
    panel.material.emissive = { 1.f, 0.6f, 0.2f };
    panel.material.emissive_intensity = 1.f;
    panel.needs_lightmap = false;
    panel.factor = std::string("accent");
    stage.register_item(panel);

    workbench_light ceiling;
    ceiling.kind = light_kind::spot;
    ceiling.world_matrix = mul(make_translation_matrix({ 0, half - 0.05f, 0 }), make_rotation_matrix({ 1, 0, 0 }, -quarter));
    ceiling.intensity = 4.f;
    ceiling.spot_angle = float(LUMINA_PI) / 3.f;
    ceiling.spot_penumbra = 0.3f;
    ceiling.distance = 8.f;
    stage.register_light(ceiling);
}

int main(int argc, char * argv[])
{
    try
    {
        const app_options options = parse_options(argc, argv);

        bake_settings settings;
        settings.auto_uv_world_width = 16.f;
        if (!options.config_path.empty()) settings = load_bake_settings(options.config_path);
        validate_bake_settings(settings);
        if (!options.save_config_path.empty()) save_bake_settings(options.save_config_path, settings);

        // the device must be destroyed before the context it was created in
        std::unique_ptr<gl_context> context;
        std::unique_ptr<render_device> device;

        if (options.soft)
        {
            device.reset(new soft_render_device());
        }
        else
        {
            context.reset(new gl_context());
            device.reset(new gl_render_device(settings.output_filter));
        }

        lightmap_baker baker(settings);
        stage_cornell_room(baker.get_stage(), settings);
        baker.start(*device);

        auto comp = baker.get_compositor();
        comp->set_multiplier(std::string("accent"), options.accent);

        simple_cpu_timer timer;
        timer.start();

        uint64_t ticks = 0;
        while (!baker.is_complete())
        {
            baker.tick(*device);
            if (++ticks > options.max_ticks) throw std::runtime_error("bake did not finish within " + std::to_string(options.max_ticks) + " ticks");

            if (ticks % 100 == 0)
            {
                if (const auto * renderer = baker.get_sequence()->get_current_renderer())
                {
                    log::get()->bake_log->info("{} pass {} at texel {}", renderer->describe(), renderer->get_pass_index() + 1, renderer->get_texel_counter());
                }
            }
        }

        comp->render(*device);
        timer.stop();

        log::get()->bake_log->info("bake finished after {} ticks in {:.1f} ms", ticks, timer.elapsed_ms());

        export_lightmap_hdr(*comp->get_output(), options.output_prefix + ".hdr");
        export_lightmap_png(*comp->get_output(), options.output_prefix + ".png", options.exposure);

        export_lightmap_hdr(*comp->get_layer_texture({}), options.output_prefix + "-base.hdr");
        for (const auto & name : comp->get_factor_names())
        {
            export_lightmap_hdr(*comp->get_layer_texture(name), options.output_prefix + "-" + name + ".hdr");
        }
    }
    catch (const std::exception & e)
    {
        log::get()->bake_log->critical("Application Fatal: {}", e.what());
        std::cerr << "Application Fatal: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
