#pragma once

#ifndef lumina_irradiance_renderer_hpp
#define lumina_irradiance_renderer_hpp

#include "lumina-bake/work-scheduler.hpp"
#include "lumina-bake/light-probe.hpp"
#include "lumina-bake/bake-settings.hpp"

#include "lumina-core/util/simple-timer.hpp"

namespace lumina
{
    enum class renderer_phase : uint32_t
    {
        idle,
        pass_setup,
        texel_sweep,
        pass_complete,
        done
    };

    const char * to_string(const renderer_phase phase);

    // Offsets of the 3x3 brush used to bleed sampled values into empty neighbors, counter-clockwise from +X
    static const int brush_offset_x[8] = { 1, 1, 0, -1, -1, -1, 0, 1 };
    static const int brush_offset_y[8] = { 0, 1, 1, 1, 0, -1, -1, -1 };

    /////////////////////////////
    //   irradiance_renderer   //
    /////////////////////////////

    // Bakes one layer (workbench, factor, time) into `output` over several bounce passes. Each pass
    // sweeps the atlas in row-major order, a bounded number of texels per step, and renders one probe
    // per populated texel. Pass N > 0 sees the result of pass N - 1 as the scene's lightmap and adds
    // its samples on top of what the output held when the pass started.
    class irradiance_renderer final : public bake_job
    {
        std::shared_ptr<const workbench> wb;
        factor_name factor;
        float time;
        bake_settings settings;

        std::shared_ptr<lightmap_texture> output;           // accumulated result, shared with the compositor
        std::shared_ptr<lightmap_texture> passOutput;       // samples of the current pass only
        std::shared_ptr<lightmap_texture> previousOutput;   // completed pass, fed back as scene lighting
        image_buffer<float> passBase;                       // output as it was when the pass started

        light_probe_sampler sampler;
        std::shared_ptr<const light_scene> lightScene;

        renderer_phase phase{ renderer_phase::idle };
        int passIndex{ -1 };
        size_t texelCounter{ 0 };
        simple_cpu_timer passTimer;

        void setup_pass();
        void store_sample(const size_t texelIndex, const float4 & value);
        void write_texel(const size_t texelIndex, const float4 & value);

    public:

        irradiance_renderer(std::shared_ptr<const workbench> wb, std::shared_ptr<lightmap_texture> output, const bake_settings & settings, const factor_name & factor = {}, const float time = 0.f);

        void update() override final;
        std::shared_ptr<const light_scene> get_light_scene() const override final { return lightScene; }
        step_result step(render_device & device, const light_scene & scene) override final;
        bool is_complete() const override final { return phase == renderer_phase::done; }
        std::string describe() const override final;

        renderer_phase get_phase() const { return phase; }
        int get_pass_index() const { return passIndex; }
        size_t get_texel_counter() const { return texelCounter; }
        const factor_name & get_factor() const { return factor; }
        float get_time() const { return time; }

        std::shared_ptr<const lightmap_texture> get_output() const { return output; }
        std::shared_ptr<const lightmap_texture> get_pass_output() const { return passOutput; }
        std::shared_ptr<const lightmap_texture> get_previous_output() const { return previousOutput; }
    };

} // end namespace lumina

#endif // end lumina_irradiance_renderer_hpp
