#include "dbus-interface.hpp"

#include <giomm.h>
#include <glibmm.h>

#include <stdexcept>
#include <typeinfo>

#include <wayfire/util/log.hpp>

static const auto introspection_data = Gio::DBus::NodeInfo::create_for_xml(
    R"(
<?xml version="1.0" encoding="UTF-8"?>
<node name="/org/freedesktop/Notifications">
    <interface name="org.freedesktop.Notifications">
        <method name="GetCapabilities">
            <arg direction="out" name="capabilities"    type="as"/>
        </method>
        <method name="Notify">
            <arg direction="in"  name="app_name"        type="s"/>
            <arg direction="in"  name="replaces_id"     type="u"/>
            <arg direction="in"  name="app_icon"        type="s"/>
            <arg direction="in"  name="summary"         type="s"/>
            <arg direction="in"  name="body"            type="s"/>
            <arg direction="in"  name="actions"         type="as"/>
            <arg direction="in"  name="hints"           type="a{sv}"/>
            <arg direction="in"  name="expire_timeout"  type="i"/>
            <arg direction="out" name="id"              type="u"/>
        </method>
        <method name="CloseNotification">
            <arg direction="in"  name="id"              type="u"/>
        </method>
        <method name="GetServerInformation">
            <arg direction="out" name="name"            type="s"/>
            <arg direction="out" name="vendor"          type="s"/>
            <arg direction="out" name="version"         type="s"/>
            <arg direction="out" name="spec_version"    type="s"/>
        </method>
        <signal name="NotificationClosed">
            <arg name="id"         type="u"/>
            <arg name="reason"     type="u"/>
        </signal>
        <signal name="ActionInvoked">
            <arg name="id"         type="u"/>
            <arg name="action_key" type="s"/>
        </signal>
    </interface>
</node>
)")->lookup_interface();

namespace
{
template<class... T>
void extractValues(const Glib::VariantBase & variant, T&... values)
{
    try {
        std::tie(values...) = Glib::VariantBase::cast_dynamic<Glib::Variant<std::tuple<T...>>>(variant).get();
    } catch (const std::bad_cast&)
    {
        throw std::invalid_argument("Unexpected arguments of type " + variant.get_type_string());
    }
}
} // namespace

Notification::id_type notifyWithParameters(Daemon & daemon, const Glib::VariantContainerBase & parameters)
{
    Glib::ustring app_name;
    Notification::id_type replaces_id;
    Glib::ustring app_icon;
    Glib::ustring summary;
    Glib::ustring body;
    std::vector<Glib::ustring> actions;
    std::map<Glib::ustring, Glib::VariantBase> hints;
    gint32 expire_timeout;
    extractValues(parameters, app_name, replaces_id, app_icon, summary, body, actions, hints, expire_timeout);

    // popups are dismissed after the configured timeout instead of expire_timeout
    return daemon.notify(app_name, replaces_id, app_icon, summary, body, actions, NotificationHints(hints));
}

dbus_method(NotificationsDBus::GetCapabilities)
{
    const auto value = Glib::Variant<std::tuple<std::vector<Glib::ustring>>>::create(
        {daemon.getCapabilities()});
    invocation->return_value(value);
}

dbus_method(NotificationsDBus::Notify)
try {
    const auto id = notifyWithParameters(daemon, parameters);
    invocation->return_value(
        Glib::VariantContainerBase::create_tuple(Glib::Variant<Notification::id_type>::create(id)));
} catch (const std::invalid_argument & err)
{
    LOGW("Invalid Notify call from ", sender, ": ", err.what());
    invocation->return_error(Gio::DBus::Error(Gio::DBus::Error::INVALID_ARGS, err.what()));
}

dbus_method(NotificationsDBus::CloseNotification)
try {
    Notification::id_type id;
    extractValues(parameters, id);
    invocation->return_value(Glib::VariantContainerBase());
    daemon.closeNotification(id);
} catch (const std::invalid_argument & err)
{
    invocation->return_error(Gio::DBus::Error(Gio::DBus::Error::INVALID_ARGS, err.what()));
}

dbus_method(NotificationsDBus::GetServerInformation)
{
    const auto info = daemon.getServerInformation();
    const auto value =
        Glib::Variant<std::tuple<Glib::ustring, Glib::ustring, Glib::ustring, Glib::ustring>>::create(
            {info.name, info.vendor, info.version, info.spec_version});
    invocation->return_value(value);
}

void NotificationsDBus::on_interface_method_call(const Glib::RefPtr<Gio::DBus::Connection> & connection,
    const Glib::ustring & sender, const Glib::ustring & object_path,
    const Glib::ustring & interface_name, const Glib::ustring & method_name,
    const Glib::VariantContainerBase & parameters,
    const Glib::RefPtr<Gio::DBus::MethodInvocation> & invocation)
{
#define try_invoke_method(_name)                                                                                       \
    if (method_name == #_name)                                                                                         \
    {                                                                                                                  \
        _name ## dbus_method(sender, parameters, invocation);                                                          \
        return;                                                                                                        \
    }

    try_invoke_method(GetCapabilities);
    try_invoke_method(Notify);
    try_invoke_method(CloseNotification);
    try_invoke_method(GetServerInformation);
#undef try_invoke_method

    invocation->return_error(Gio::DBus::Error(Gio::DBus::Error::UNKNOWN_METHOD,
        "Unknown method " + interface_name + "." + method_name));
}

void NotificationsDBus::on_bus_acquired(const Glib::RefPtr<Gio::DBus::Connection> & connection,
    const Glib::ustring & name)
{
    daemon_connection = connection;
    register_object();
}

void NotificationsDBus::on_name_acquired(const Glib::RefPtr<Gio::DBus::Connection> & connection,
    const Glib::ustring & name)
{
    LOGI("Acquired bus name ", name);
    name_owned = true;
    // a queued request can be granted after the name was lost and the object unregistered
    if (daemon_connection && (object_id == 0))
    {
        register_object();
    }
}

void NotificationsDBus::on_name_lost(const Glib::RefPtr<Gio::DBus::Connection> & connection,
    const Glib::ustring & name)
{
    if (name_owned)
    {
        LOGW("Lost bus name ", name, " to another notification daemon");
    } else
    {
        LOGW("Another notification daemon is already running. Stop it or start with --replace, "
             "notifications are not received over D-Bus until then.");
    }

    name_owned = false;
    unregister_object();
}

void NotificationsDBus::register_object()
{
    try {
        object_id = daemon_connection->register_object(FDN_PATH, introspection_data, interface_vtable);
    } catch (const Glib::Error & err)
    {
        LOGE("Failed to export " FDN_PATH ": ", err.what());
    }
}

void NotificationsDBus::unregister_object()
{
    if (daemon_connection && (object_id != 0))
    {
        daemon_connection->unregister_object(object_id);
        object_id = 0;
    }
}

void NotificationsDBus::emit_notification_closed(Notification::id_type id, Daemon::CloseReason reason)
{
    if (!daemon_connection || (object_id == 0))
    {
        return;
    }

    const auto body = Glib::Variant<std::tuple<guint32, guint32>>::create({id, reason});
    try {
        daemon_connection->emit_signal(FDN_PATH, FDN_NAME, "NotificationClosed", {}, body);
    } catch (const Glib::Error & err)
    {
        LOGE("Failed to emit NotificationClosed for ", id, ": ", err.what());
    }
}

void NotificationsDBus::emit_action_invoked(Notification::id_type id, const Glib::ustring & action_key)
{
    if (!daemon_connection || (object_id == 0))
    {
        return;
    }

    const auto body = Glib::Variant<std::tuple<guint32, Glib::ustring>>::create({id, action_key});
    try {
        daemon_connection->emit_signal(FDN_PATH, FDN_NAME, "ActionInvoked", {}, body);
    } catch (const Glib::Error & err)
    {
        LOGE("Failed to emit ActionInvoked for ", id, ": ", err.what());
    }
}

NotificationsDBus::NotificationsDBus(Daemon & daemon, bool replace) :
    daemon(daemon)
{
    notification_closed_conn = daemon.signalNotificationClosed().connect(
        sigc::mem_fun(this, &NotificationsDBus::emit_notification_closed));
    action_invoked_conn = daemon.signalActionInvoked().connect(
        sigc::mem_fun(this, &NotificationsDBus::emit_action_invoked));

    auto flags = Gio::DBus::BUS_NAME_OWNER_FLAGS_NONE;
    if (replace)
    {
        flags = Gio::DBus::BUS_NAME_OWNER_FLAGS_REPLACE | Gio::DBus::BUS_NAME_OWNER_FLAGS_ALLOW_REPLACEMENT;
    }

    owner_id = Gio::DBus::own_name(Gio::DBus::BUS_TYPE_SESSION, FDN_NAME,
        sigc::mem_fun(this, &NotificationsDBus::on_bus_acquired),
        sigc::mem_fun(this, &NotificationsDBus::on_name_acquired),
        sigc::mem_fun(this, &NotificationsDBus::on_name_lost),
        flags);
}

NotificationsDBus::~NotificationsDBus()
{
    notification_closed_conn.disconnect();
    action_invoked_conn.disconnect();
    unregister_object();
    Gio::DBus::unown_name(owner_id);
}

bool NotificationsDBus::isNameOwned() const
{
    return name_owned;
}

bool NotificationsDBus::isExported() const
{
    return object_id != 0;
}
