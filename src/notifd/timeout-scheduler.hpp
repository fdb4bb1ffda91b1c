#ifndef NOTIFICATION_TIMEOUT_SCHEDULER_HPP
#define NOTIFICATION_TIMEOUT_SCHEDULER_HPP

#include <functional>

#include <glibmm/main.h>
#include <sigc++/connection.h>

/**
 * Runs callbacks once after a delay. Disconnecting the returned connection
 * cancels the callback if it did not run yet.
 */
class TimeoutScheduler
{
  public:
    virtual ~TimeoutScheduler() = default;
    virtual sigc::connection schedule(guint interval_ms, std::function<void()> callback) = 0;
};

/**
 * Schedules on the default GLib main context.
 */
class GlibTimeoutScheduler : public TimeoutScheduler
{
  public:
    sigc::connection schedule(guint interval_ms, std::function<void()> callback) override
    {
        return Glib::signal_timeout().connect([callback] ()
        {
            callback();
            return false;
        }, interval_ms);
    }
};

#endif
