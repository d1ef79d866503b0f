#pragma once

#include "sightline_rt/threading/signals.hpp"
#include <stop_token>

namespace sightline_rt::threading
{
    // Runs Init/Run/Shutdown of Derived on the calling thread. Run is invoked
    // repeatedly until a stop is requested by Derived or by a signal.
    template <typename Derived>
    class Loop
    {
    public:
        Loop() = default;

        void Exec()
        {
            init_();

            while (!stop_source_.stop_requested())
            {
                if (signals::StopRequested())
                    break;
                run_();
            }

            shutdown_();
        }

        void RequestStop() { stop_source_.request_stop(); }

        ~Loop() {};

    protected:
        std::stop_token get_stop_token() const { return stop_source_.get_token(); }

    private:
        std::stop_source stop_source_;

        void init_() { static_cast<Derived *>(this)->Init(); }

        void run_() { static_cast<Derived *>(this)->Run(); }

        void shutdown_() { static_cast<Derived *>(this)->Shutdown(); }
    };
} // namespace sightline_rt::threading
