#include "notifd.hpp"

#include <algorithm>

#include <gdkmm/wrap_init.h>
#include <glibmm/miscutils.h>
#include <glibmm/variant.h>
#include <wayfire/util/log.hpp>

WayfireNotifd::WayfireNotifd() :
    WayfireServiceApp("org.wayfire.notifd"),
    cache_dir(Glib::get_user_cache_dir() + "/wf-notifd"),
    store(cache_dir + "/notifications.json"),
    images(cache_dir + "/images")
{}

WayfireNotifd::~WayfireNotifd()
{
    changed_conn.disconnect();
}

Daemon& WayfireNotifd::daemon()
{
    if (!notification_daemon)
    {
        notification_daemon = std::make_unique<Daemon>(store, images, scheduler);
    }

    return *notification_daemon;
}

void WayfireNotifd::on_activate()
{
    WayfireServiceApp::on_activate();

    popup_timeout = std::make_unique<WfOption<int>>(config, "notifd/popup_timeout");
    start_in_dnd  = std::make_unique<WfOption<bool>>(config, "notifd/dnd");
    popup_timeout->set_callback([=] () { update_popup_timeout(); });

    update_popup_timeout();
    daemon().setDnd(*start_in_dnd);

    dbus = std::make_unique<NotificationsDBus>(daemon(), cmdline_replace);
    add_actions();
}

void WayfireNotifd::on_config_reload()
{
    if (popup_timeout)
    {
        update_popup_timeout();
    }
}

void WayfireNotifd::update_popup_timeout()
{
    int timeout = *popup_timeout;
    daemon().setPopupTimeout(std::max(timeout, 0));
}

void WayfireNotifd::add_actions()
{
    dnd_action = Gio::SimpleAction::create_bool("dnd", daemon().getDnd());
    dnd_action->signal_activate().connect([=] (const Glib::VariantBase&)
    {
        daemon().setDnd(!daemon().getDnd());
    });
    app->add_action(dnd_action);

    changed_conn = daemon().signalChanged().connect([=] ()
    {
        bool state = false;
        dnd_action->get_state(state);
        if (state != daemon().getDnd())
        {
            dnd_action->set_state(Glib::Variant<bool>::create(daemon().getDnd()));
        }
    });

    app->add_action("clear", [=] () { daemon().clear(); });

    const Glib::VariantType id_type{"u"};
    auto close_action = Gio::SimpleAction::create("close", id_type);
    close_action->signal_activate().connect([=] (const Glib::VariantBase & parameter)
    {
        daemon().closeNotification(
            Glib::VariantBase::cast_dynamic<Glib::Variant<Notification::id_type>>(parameter).get());
    });
    app->add_action(close_action);

    auto dismiss_action = Gio::SimpleAction::create("dismiss", id_type);
    dismiss_action->signal_activate().connect([=] (const Glib::VariantBase & parameter)
    {
        daemon().dismissNotification(
            Glib::VariantBase::cast_dynamic<Glib::Variant<Notification::id_type>>(parameter).get());
    });
    app->add_action(dismiss_action);

    auto invoke_action = Gio::SimpleAction::create("invoke", Glib::VariantType{"(us)"});
    invoke_action->signal_activate().connect([=] (const Glib::VariantBase & parameter)
    {
        const auto [id, action_key] = Glib::VariantBase::cast_dynamic<
            Glib::Variant<std::tuple<Notification::id_type, Glib::ustring>>>(parameter).get();
        daemon().invokeAction(id, action_key);
    });
    app->add_action(invoke_action);
}

int main(int argc, char **argv)
{
    // there is no Gtk::Application to register the Gdk::Pixbuf wrappers for us
    Gdk::wrap_init();
    WayfireNotifd notifd;
    return notifd.run(argc, argv);
}
