#include "lumina-bake/work-scheduler.hpp"
#include "lumina-bake/logging.hpp"

#include "lumina-core/util/simple-timer.hpp"

#include <algorithm>
#include <stdexcept>

namespace lumina
{
    void work_scheduler::connection::disconnect()
    {
        if (auto r = registry.lock())
        {
            auto & jobs = r->jobs;
            jobs.erase(std::remove_if(jobs.begin(), jobs.end(), [this](const std::pair<job_id, std::shared_ptr<bake_job>> & e) { return e.first == id; }), jobs.end());
        }
        registry.reset();
    }

    bool work_scheduler::connection::connected() const
    {
        auto r = registry.lock();
        if (!r) return false;
        return std::any_of(r->jobs.begin(), r->jobs.end(), [this](const std::pair<job_id, std::shared_ptr<bake_job>> & e) { return e.first == id; });
    }

    work_scheduler::work_scheduler() : registry(std::make_shared<job_registry>()) {}

    work_scheduler::connection work_scheduler::register_job(std::shared_ptr<bake_job> job)
    {
        if (!job) throw std::invalid_argument("cannot register a null bake job");
        const job_id id = ++lastId;
        registry->jobs.emplace_back(id, std::move(job));
        return connection(registry, id);
    }

    tick_result work_scheduler::tick(render_device & device, const double budgetMs)
    {
        simple_cpu_timer timer;
        timer.start();

        tick_result result;

        // snapshot so that jobs disconnected during this tick stay alive until it ends
        std::vector<std::shared_ptr<bake_job>> jobs;
        for (const auto & entry : registry->jobs) jobs.push_back(entry.second);

        std::shared_ptr<bake_job> active;
        std::shared_ptr<const light_scene> scene;

        try
        {
            for (auto & job : jobs) job->update();

            for (auto & job : jobs)
            {
                if (job->is_complete()) continue;
                scene = job->get_light_scene();
                if (!scene) continue;
                active = job;
                break;
            }

            while (active && scene)
            {
                active->step(device, *scene);
                result.did_work = true;
                result.steps++;

                if (budgetMs <= 0.0 || timer.elapsed_ms() >= budgetMs) break;
                if (active->is_complete()) break;
                scene = active->get_light_scene();
            }
        }
        catch (const std::exception & e)
        {
            log::get()->bake_log->error("{} failed: {}", active ? active->describe() : std::string("bake job update"), e.what());
            throw;
        }

        timer.stop();
        result.elapsed_ms = timer.elapsed_ms();
        return result;
    }

} // end namespace lumina
