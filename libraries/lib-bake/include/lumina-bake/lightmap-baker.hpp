#pragma once

#ifndef lumina_lightmap_baker_hpp
#define lumina_lightmap_baker_hpp

#include "lumina-bake/irradiance-renderer.hpp"
#include "lumina-bake/compositor.hpp"
#include "lumina-bake/workbench.hpp"

namespace lumina
{
    //////////////////////////////
    //   factor_bake_sequence   //
    //////////////////////////////

    // Bakes the base layer and then every factor of the workbench, in order, into the matching
    // compositor layer textures. Only one renderer exists at a time; the next one starts in the
    // same update that sees the previous one finish.
    class factor_bake_sequence final : public bake_job
    {
        std::shared_ptr<const workbench> wb;
        std::shared_ptr<compositor> comp;
        bake_settings settings;

        std::vector<factor_name> order;
        size_t orderIndex{ 0 };
        std::unique_ptr<irradiance_renderer> current;

        void start_current();

    public:

        factor_bake_sequence(std::shared_ptr<const workbench> wb, std::shared_ptr<compositor> comp, const bake_settings & settings);

        void update() override final;
        std::shared_ptr<const light_scene> get_light_scene() const override final;
        step_result step(render_device & device, const light_scene & scene) override final;
        bool is_complete() const override final { return orderIndex >= order.size(); }
        std::string describe() const override final;

        const std::vector<factor_name> & get_order() const { return order; }
        const irradiance_renderer * get_current_renderer() const { return current.get(); }
    };

    ///////////////////////
    //   keyframe_bake   //
    ///////////////////////

    // One renderer per time value for a single factor, each accumulating into its own texture
    class keyframe_bake final : public bake_job
    {
        std::shared_ptr<const workbench> wb;
        factor_name factor;
        std::vector<float> times;
        std::vector<std::unique_ptr<irradiance_renderer>> renderers;

    public:

        keyframe_bake(std::shared_ptr<const workbench> wb, const bake_settings & settings, const factor_name & factor, const std::vector<float> & times);

        void update() override final;
        std::shared_ptr<const light_scene> get_light_scene() const override final;
        step_result step(render_device & device, const light_scene & scene) override final;
        bool is_complete() const override final;
        std::string describe() const override final;

        size_t num_keyframes() const { return renderers.size(); }
        float get_time(const size_t keyframe) const { return times.at(keyframe); }
        std::shared_ptr<const lightmap_texture> get_output(const size_t keyframe) const { return renderers.at(keyframe)->get_output(); }
    };

    ////////////////////////
    //   lightmap_baker   //
    ////////////////////////

    // Owns a stage, a scheduler and the state of the current bake. start() freezes the stage into a
    // workbench, maps its atlas and schedules a factor sequence; calling it again discards all of that.
    class lightmap_baker : public non_copyable
    {
        bake_settings settings;
        workbench_stage stage;
        work_scheduler scheduler;

        std::shared_ptr<const workbench> wb;
        std::shared_ptr<compositor> comp;
        std::shared_ptr<factor_bake_sequence> sequence;
        work_scheduler::scoped_connection sequenceConnection;

    public:

        explicit lightmap_baker(const bake_settings & settings);

        workbench_stage & get_stage() { return stage; }
        work_scheduler & get_scheduler() { return scheduler; }
        const bake_settings & get_settings() const { return settings; }

        void start(render_device & device);

        // One scheduler tick within the configured frame budget, then a composite of all layers
        tick_result tick(render_device & device);

        bool is_started() const { return wb != nullptr; }
        bool is_complete() const { return sequence && sequence->is_complete(); }

        std::shared_ptr<const workbench> get_workbench() const { return wb; }
        std::shared_ptr<compositor> get_compositor() const { return comp; }
        std::shared_ptr<const factor_bake_sequence> get_sequence() const { return sequence; }
    };

} // end namespace lumina

#endif // end lumina_lightmap_baker_hpp
