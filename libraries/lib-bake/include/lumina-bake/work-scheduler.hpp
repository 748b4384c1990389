#pragma once

#ifndef lumina_work_scheduler_hpp
#define lumina_work_scheduler_hpp

#include "lumina-bake/render-device.hpp"

namespace lumina
{
    struct step_result
    {
        size_t texels_examined{ 0 };
        size_t probes_rendered{ 0 };
        bool pass_complete{ false };
    };

    //////////////////
    //   bake_job   //
    //////////////////

    // Resumable unit of baking work. The scheduler calls update() on every job each tick and
    // step() on at most one of them, so all GPU work for a tick happens inside a single job.
    class bake_job
    {
    public:
        virtual ~bake_job() {}
        virtual void update() = 0;                                          // host-side state transitions, no device access
        virtual std::shared_ptr<const light_scene> get_light_scene() const = 0; // null while there is nothing to render
        virtual step_result step(render_device & device, const light_scene & scene) = 0;
        virtual bool is_complete() const = 0;
        virtual std::string describe() const { return "bake job"; }
    };

    struct tick_result
    {
        bool did_work{ false };
        int steps{ 0 };
        double elapsed_ms{ 0.0 };
    };

    ////////////////////////
    //   work_scheduler   //
    ////////////////////////

    class work_scheduler : public non_copyable
    {
    public:

        typedef uint32_t job_id;

        struct job_registry
        {
            std::vector<std::pair<job_id, std::shared_ptr<bake_job>>> jobs; // registration order
        };

        class connection
        {
            std::weak_ptr<job_registry> registry;
            job_id id{ 0 };
        public:
            connection() {};
            connection(const std::weak_ptr<job_registry> & registry, job_id id) : registry(registry), id(id) {}
            void disconnect();
            bool connected() const;
        };

        class scoped_connection
        {
            connection c;
            scoped_connection(const scoped_connection &) = delete;
            scoped_connection & operator= (const scoped_connection &) = delete;
        public:
            scoped_connection() {}
            scoped_connection(connection c) : c(c) {}
            scoped_connection(scoped_connection && r) : c(r.c) { r.c = {}; }
            scoped_connection & operator= (scoped_connection && r) { if (this != &r) { disconnect(); c = r.c; r.c = {}; } return *this; }
            ~scoped_connection() { disconnect(); }
            void disconnect() { c.disconnect(); }
            bool connected() const { return c.connected(); }
        };

    private:

        job_id lastId{ 0 };
        std::shared_ptr<job_registry> registry;

    public:

        work_scheduler();

        connection register_job(std::shared_ptr<bake_job> job);

        size_t num_jobs() const { return registry->jobs.size(); }

        // Runs one frame of work. With budgetMs <= 0 the active job is stepped exactly once, otherwise
        // it keeps stepping while it has a light scene and the budget is not used up.
        tick_result tick(render_device & device, const double budgetMs = 0.0);
    };

} // end namespace lumina

#endif // end lumina_work_scheduler_hpp
