#ifndef WF_NOTIFD_HPP
#define WF_NOTIFD_HPP

#include <memory>
#include <string>

#include <giomm/simpleaction.h>

#include "daemon.hpp"
#include "dbus-interface.hpp"
#include "image-resolver.hpp"
#include "notification-store.hpp"
#include "timeout-scheduler.hpp"
#include "wf-option-wrap.hpp"
#include "wf-service-app.hpp"

/**
 * The notification daemon process. It owns the Daemon and everything it
 * depends on, exports it on D-Bus and offers the local controls (do not
 * disturb, clear, close, dismiss, invoke) as application actions, so that
 * they can be triggered with `gapplication action org.wayfire.notifd <action>`.
 */
class WayfireNotifd : public WayfireServiceApp
{
  public:
    WayfireNotifd();
    ~WayfireNotifd() override;

    /*!
     * The notification daemon of this process, created on first use.
     */
    Daemon& daemon();

    void on_activate() override;
    void on_config_reload() override;

  protected:
    std::string get_config_file_name() override
    {
        return "wf-notifd.ini";
    }

    std::string get_defaults_file_name() override
    {
        return "wf-notifd-defaults.ini";
    }

  private:
    const std::string cache_dir;
    NotificationStore store;
    ImageResolver images;
    GlibTimeoutScheduler scheduler;

    std::unique_ptr<Daemon> notification_daemon;
    std::unique_ptr<NotificationsDBus> dbus;

    std::unique_ptr<WfOption<int>> popup_timeout;
    std::unique_ptr<WfOption<bool>> start_in_dnd;

    Glib::RefPtr<Gio::SimpleAction> dnd_action;
    sigc::connection changed_conn;

    void add_actions();
    void update_popup_timeout();
};

#endif /* end of include guard: WF_NOTIFD_HPP */
