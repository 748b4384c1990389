#include "lumina-bake/workbench.hpp"
#include "lumina-bake/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace lumina
{
    const char * to_string(const light_kind kind)
    {
        switch (kind)
        {
        case light_kind::directional: return "directional";
        case light_kind::spot: return "spot";
        case light_kind::point: return "point";
        case light_kind::ambient: return "ambient";
        }
        return "unknown";
    }

    void validate_workbench_item(const workbench_item & item)
    {
        if (!item.mesh) throw std::invalid_argument("expected mesh geometry");

        const runtime_mesh & mesh = *item.mesh;

        if (item.material.kind == material_kind::unlit) throw std::invalid_argument("unsupported material type: unlit");
        if (count_materials(mesh) > 1) throw std::invalid_argument("expected single material, got material array");

        for (const auto & f : mesh.faces)
        {
            if (f.x >= mesh.vertices.size() || f.y >= mesh.vertices.size() || f.z >= mesh.vertices.size())
            {
                throw std::invalid_argument("face index out of vertex range");
            }
        }

        if (!mesh.normals.empty() && mesh.normals.size() != mesh.vertices.size()) throw std::invalid_argument("expected normal attribute");
        if (!mesh.texcoord1.empty() && mesh.texcoord1.size() != mesh.vertices.size()) throw std::invalid_argument("expected uv2 attribute");

        if (!item.needs_lightmap) return;

        if (mesh.faces.empty()) throw std::invalid_argument("expected face index array");
        if (mesh.texcoord1.empty()) throw std::invalid_argument("expected uv2 attribute");
        if (mesh.normals.empty()) throw std::invalid_argument("expected normal attribute");

        if (mesh.faces.size() > max_item_faces)
        {
            throw std::invalid_argument("too many faces for lightmap item: " + std::to_string(mesh.faces.size()) + " (limit " + std::to_string(max_item_faces) + ")");
        }
    }

    void validate_workbench_light(const workbench_light & light)
    {
        if (light.kind != light_kind::directional && light.kind != light_kind::spot)
        {
            throw std::invalid_argument(std::string("unsupported light kind: ") + to_string(light.kind));
        }

        if (light.kind == light_kind::spot && (light.spot_angle <= 0.f || light.spot_angle >= float(LUMINA_HALF_PI)))
        {
            throw std::invalid_argument("spot light angle must be in (0, pi/2)");
        }
    }

    stage_handle workbench_stage::register_item(const workbench_item & item)
    {
        validate_workbench_item(item);
        const stage_handle h = ++lastHandle;
        items.emplace(h, item);
        return h;
    }

    void workbench_stage::unregister_item(const stage_handle handle)
    {
        if (items.erase(handle) == 0) throw std::invalid_argument("unknown item handle: " + std::to_string(handle));
    }

    stage_handle workbench_stage::register_light(const workbench_light & light)
    {
        validate_workbench_light(light);
        const stage_handle h = ++lastHandle;
        lights.emplace(h, light);
        return h;
    }

    void workbench_stage::unregister_light(const stage_handle handle)
    {
        if (lights.erase(handle) == 0) throw std::invalid_argument("unknown light handle: " + std::to_string(handle));
    }

    workbench workbench_stage::snapshot()
    {
        workbench wb;
        wb.id = ++lastWorkbenchId;

        auto note_factor = [&wb](const factor_name & f)
        {
            if (f && std::find(wb.factor_names.begin(), wb.factor_names.end(), *f) == wb.factor_names.end())
            {
                wb.factor_names.push_back(*f);
            }
        };

        for (const auto & entry : items)
        {
            wb.items.push_back(entry.second);
            note_factor(entry.second.factor);
        }

        for (const auto & entry : lights)
        {
            wb.lights.push_back(entry.second);
            note_factor(entry.second.factor);
        }

        log::get()->bake_log->info("workbench {} staged with {} items, {} lights, {} factors", wb.id, wb.items.size(), wb.lights.size(), wb.factor_names.size());

        return wb;
    }

} // end namespace lumina
