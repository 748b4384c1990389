#include "lumina-bake/irradiance-renderer.hpp"
#include "lumina-bake/logging.hpp"

#include <stdexcept>

namespace lumina
{
    const char * to_string(const renderer_phase phase)
    {
        switch (phase)
        {
        case renderer_phase::idle: return "idle";
        case renderer_phase::pass_setup: return "pass_setup";
        case renderer_phase::texel_sweep: return "texel_sweep";
        case renderer_phase::pass_complete: return "pass_complete";
        case renderer_phase::done: return "done";
        }
        return "unknown";
    }

    irradiance_renderer::irradiance_renderer(std::shared_ptr<const workbench> wb, std::shared_ptr<lightmap_texture> output, const bake_settings & settings, const factor_name & factor, const float time)
        : wb(std::move(wb)), factor(factor), time(time), settings(settings), output(std::move(output)), sampler(settings.probe_size, settings.probe_batch_count)
    {
        if (!this->wb) throw std::invalid_argument("irradiance renderer needs a workbench");
        if (!this->output) throw std::invalid_argument("irradiance renderer needs an output texture");

        const atlas_map & atlas = this->wb->atlas;
        if (atlas.width <= 0 || atlas.height <= 0 || atlas.data.empty()) throw std::invalid_argument("workbench atlas has not been mapped");
        if (this->output->width() != atlas.width || this->output->height() != atlas.height) throw std::invalid_argument("output texture size does not match the atlas");
        if (settings.pass_count < 1) throw std::invalid_argument("irradiance renderer needs at least one pass");
        if (settings.texel_budget < 1) throw std::invalid_argument("texel budget must be positive");

        passOutput = std::make_shared<lightmap_texture>(atlas.width, atlas.height);
        previousOutput = std::make_shared<lightmap_texture>(atlas.width, atlas.height);
    }

    std::string irradiance_renderer::describe() const
    {
        return "irradiance renderer [workbench " + std::to_string(wb->id) + ", factor " + to_string(factor) + ", time " + std::to_string(time) + "]";
    }

    void irradiance_renderer::update()
    {
        if (phase == renderer_phase::idle)
        {
            setup_pass();
        }
        else if (phase == renderer_phase::pass_complete)
        {
            if (passIndex + 1 < settings.pass_count)
            {
                setup_pass();
            }
            else
            {
                phase = renderer_phase::done;
                log::get()->bake_log->info("{} done after {} passes", describe(), passIndex + 1);
            }
        }
    }

    void irradiance_renderer::setup_pass()
    {
        phase = renderer_phase::pass_setup;
        passIndex++;
        texelCounter = 0;

        previousOutput->copy_from(*passOutput);
        passOutput->clear();

        if (passIndex == 0)
        {
            // unsampled texels of the base layer stay visible as a checkerboard
            if (!factor) output->fill_test_pattern();
            else output->clear();
        }
        else
        {
            passBase = output->get_buffer();
        }

        light_scene_params params;
        params.factor = factor;
        params.time = time;
        params.include_lights = (passIndex == 0); // later passes see direct light through the fed-back lightmap
        params.lightmap = (passIndex > 0) ? previousOutput : nullptr;
        params.emissive_multiplier = settings.emissive_multiplier;
        params.sky_color = settings.sky_color;
        lightScene = build_light_scene(*wb, params);

        phase = renderer_phase::texel_sweep;
        passTimer.start();

        log::get()->bake_log->info("{} pass {}/{} started", describe(), passIndex + 1, settings.pass_count);
    }

    void irradiance_renderer::write_texel(const size_t texelIndex, const float4 & value)
    {
        passOutput->set_texel(texelIndex, value);

        if (passIndex == 0)
        {
            output->set_texel(texelIndex, value);
        }
        else
        {
            const float * base = passBase.data() + texelIndex * 4;
            output->set_texel(texelIndex, { base[0] + value.x, base[1] + value.y, base[2] + value.z, 1.f });
        }
    }

    void irradiance_renderer::store_sample(const size_t texelIndex, const float4 & value)
    {
        const atlas_map & atlas = wb->atlas;
        const int64_t width = atlas.width;
        const int64_t total = static_cast<int64_t>(atlas.num_texels());

        write_texel(texelIndex, value);

        // bleed into empty neighbors so filtering near chart edges reads real data;
        // cardinal neighbors always win, diagonal ones only fill texels still empty this pass
        const int64_t texelX = static_cast<int64_t>(texelIndex) % width;
        const int64_t rowStart = static_cast<int64_t>(texelIndex) - texelX;

        for (int dir = 0; dir < 8; ++dir)
        {
            const int offX = brush_offset_x[dir];
            const int offY = brush_offset_y[dir];

            const int64_t offRowX = (width + texelX + offX) % width;
            const int64_t offRowStart = (total + rowStart + offY * width) % total;
            const size_t offTexel = static_cast<size_t>(offRowStart + offRowX);

            if (!atlas.is_empty_texel(offTexel)) continue;

            const bool isCardinal = (offX == 0 || offY == 0);
            const bool isUnfilled = passOutput->get_texel(offTexel).w == 0.f;

            if (isCardinal || isUnfilled) write_texel(offTexel, value);
        }
    }

    step_result irradiance_renderer::step(render_device & device, const light_scene & scene)
    {
        step_result result;
        if (phase != renderer_phase::texel_sweep) return result;

        const atlas_map & atlas = wb->atlas;
        const size_t total = atlas.num_texels();
        const size_t start = texelCounter;
        const size_t maxCounter = std::min(total, texelCounter + static_cast<size_t>(settings.texel_budget));

        const int rendered = sampler.render_batch(device, scene,
            [&](const light_probe_sampler::queue_fn & queue)
            {
                // skip empty texels until one is queued or the budget for this step runs out
                while (texelCounter < maxCounter)
                {
                    const size_t texelIndex = texelCounter++;
                    if (atlas.is_empty_texel(texelIndex)) continue;

                    const float4 texel = atlas.get_texel(texelIndex);
                    const atlas_face_ref ref = atlas.decode_texel(texelIndex);
                    const atlas_map_item & item = atlas.items[ref.item_index];

                    if (item.workbench_item >= scene.items.size()) throw std::runtime_error("light scene does not match the atlas items");
                    const float4x4 & world = scene.items[item.workbench_item].world_matrix;

                    queue(texelIndex, make_probe_placement(item, ref.face_index, texel.x, texel.y, world));
                    break;
                }
            },
            [&](const size_t texelIndex, const probe_readback & readback)
            {
                store_sample(texelIndex, readback.average());
            });

        output->mark_dirty();
        passOutput->mark_dirty();

        result.texels_examined = texelCounter - start;
        result.probes_rendered = static_cast<size_t>(rendered);

        if (texelCounter >= total)
        {
            passTimer.stop();
            phase = renderer_phase::pass_complete;
            lightScene.reset();
            result.pass_complete = true;

            log::get()->bake_log->info("{} pass {}/{} complete in {:.1f} ms", describe(), passIndex + 1, settings.pass_count, passTimer.elapsed_ms());
        }

        return result;
    }

} // end namespace lumina
