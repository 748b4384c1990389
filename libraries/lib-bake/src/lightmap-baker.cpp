#include "lumina-bake/lightmap-baker.hpp"
#include "lumina-bake/atlas-mapper.hpp"
#include "lumina-bake/logging.hpp"

#include <stdexcept>

namespace lumina
{
    //////////////////////////////
    //   factor_bake_sequence   //
    //////////////////////////////

    factor_bake_sequence::factor_bake_sequence(std::shared_ptr<const workbench> wb, std::shared_ptr<compositor> comp, const bake_settings & settings)
        : wb(std::move(wb)), comp(std::move(comp)), settings(settings)
    {
        if (!this->wb) throw std::invalid_argument("factor bake needs a workbench");
        if (!this->comp) throw std::invalid_argument("factor bake needs a compositor");

        order.push_back(factor_name());
        for (const auto & name : this->wb->factor_names) order.push_back(name);
    }

    void factor_bake_sequence::start_current()
    {
        const factor_name & factor = order[orderIndex];
        current.reset(new irradiance_renderer(wb, comp->get_layer_texture(factor), settings, factor));
    }

    void factor_bake_sequence::update()
    {
        if (is_complete()) return;

        if (!current) start_current();
        current->update();

        if (current->is_complete())
        {
            current.reset();
            orderIndex++;

            if (!is_complete())
            {
                start_current();
                current->update();
            }
            else
            {
                log::get()->bake_log->info("workbench {} baked {} layers", wb->id, order.size());
            }
        }
    }

    std::shared_ptr<const light_scene> factor_bake_sequence::get_light_scene() const
    {
        return current ? current->get_light_scene() : nullptr;
    }

    step_result factor_bake_sequence::step(render_device & device, const light_scene & scene)
    {
        if (!current) return {};
        return current->step(device, scene);
    }

    std::string factor_bake_sequence::describe() const
    {
        if (current) return "factor bake " + std::to_string(orderIndex + 1) + "/" + std::to_string(order.size()) + " " + current->describe();
        return "factor bake [workbench " + std::to_string(wb->id) + "]";
    }

    ///////////////////////
    //   keyframe_bake   //
    ///////////////////////

    keyframe_bake::keyframe_bake(std::shared_ptr<const workbench> wb, const bake_settings & settings, const factor_name & factor, const std::vector<float> & times)
        : wb(std::move(wb)), factor(factor), times(times)
    {
        if (!this->wb) throw std::invalid_argument("keyframe bake needs a workbench");
        if (times.empty()) throw std::invalid_argument("keyframe bake needs at least one time value");

        const atlas_map & atlas = this->wb->atlas;
        for (const float t : times)
        {
            auto output = std::make_shared<lightmap_texture>(atlas.width, atlas.height);
            renderers.emplace_back(new irradiance_renderer(this->wb, output, settings, factor, t));
        }
    }

    void keyframe_bake::update()
    {
        for (auto & r : renderers) r->update();
    }

    std::shared_ptr<const light_scene> keyframe_bake::get_light_scene() const
    {
        for (const auto & r : renderers)
        {
            if (r->is_complete()) continue;
            if (auto scene = r->get_light_scene()) return scene;
        }
        return nullptr;
    }

    step_result keyframe_bake::step(render_device & device, const light_scene & scene)
    {
        for (auto & r : renderers)
        {
            auto own = r->get_light_scene();
            if (own && own->uid == scene.uid) return r->step(device, scene);
        }
        throw std::runtime_error("light scene does not belong to any keyframe renderer");
    }

    bool keyframe_bake::is_complete() const
    {
        for (const auto & r : renderers) if (!r->is_complete()) return false;
        return true;
    }

    std::string keyframe_bake::describe() const
    {
        return "keyframe bake [workbench " + std::to_string(wb->id) + ", factor " + to_string(factor) + ", " + std::to_string(times.size()) + " keyframes]";
    }

    ////////////////////////
    //   lightmap_baker   //
    ////////////////////////

    lightmap_baker::lightmap_baker(const bake_settings & settings) : settings(settings)
    {
        validate_bake_settings(settings);
    }

    void lightmap_baker::start(render_device & device)
    {
        // drop the previous sequence before anything new is scheduled
        sequenceConnection.disconnect();
        sequence.reset();

        workbench snapshot = stage.snapshot();
        map_workbench_atlas(device, snapshot, settings.atlas_width, settings.atlas_height);

        wb = std::make_shared<const workbench>(std::move(snapshot));
        comp = std::make_shared<compositor>(settings.atlas_width, settings.atlas_height);
        sequence = std::make_shared<factor_bake_sequence>(wb, comp, settings);
        sequenceConnection = scheduler.register_job(sequence);

        log::get()->bake_log->info("started bake of workbench {} on {} ({} layers)", wb->id, device.name(), sequence->get_order().size());
    }

    tick_result lightmap_baker::tick(render_device & device)
    {
        const tick_result result = scheduler.tick(device, settings.frame_budget_ms);
        if (comp) comp->render(device);
        return result;
    }

} // end namespace lumina
