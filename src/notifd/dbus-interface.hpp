#ifndef NOTIFICATION_DBUS_INTERFACE_HPP
#define NOTIFICATION_DBUS_INTERFACE_HPP

#include "daemon.hpp"

#include <giomm/dbusconnection.h>
#include <giomm/dbusinterfacevtable.h>
#include <giomm/dbusmethodinvocation.h>
#include <giomm/dbusownname.h>

#define FDN_PATH "/org/freedesktop/Notifications"
#define FDN_NAME "org.freedesktop.Notifications"

#define dbus_method(name)                                                                                              \
    void name ## dbus_method(const Glib::ustring & sender, const Glib::VariantContainerBase & parameters,                  \
    const Glib::RefPtr<Gio::DBus::MethodInvocation> & invocation)

/*!
 * Unpacks the arguments of a Notify call, signature (susssasa{sv}i), and
 * passes them on to @daemon. Returns the id of the notification.
 *
 * Throws std::invalid_argument if @parameters have the wrong type.
 */
Notification::id_type notifyWithParameters(Daemon & daemon, const Glib::VariantContainerBase & parameters);

/**
 * Exports a Daemon as org.freedesktop.Notifications on the session bus.
 *
 * If the bus name is taken by another notification daemon, the object is not
 * exported and the Daemon keeps working for in-process users only.
 */
class NotificationsDBus
{
  public:
    /*!
     * @replace Take over the bus name from a running daemon, and let another
     * daemon take it over from us.
     */
    NotificationsDBus(Daemon & daemon, bool replace);
    ~NotificationsDBus();

    NotificationsDBus(const NotificationsDBus &) = delete;
    NotificationsDBus & operator =(const NotificationsDBus &) = delete;

    /*!
     * Whether we currently own the bus name.
     */
    bool isNameOwned() const;

    /*!
     * Whether the notifications object is registered on the bus.
     */
    bool isExported() const;

  private:
    Daemon & daemon;

    guint owner_id  = 0;
    guint object_id = 0;
    bool name_owned = false;
    Glib::RefPtr<Gio::DBus::Connection> daemon_connection;
    sigc::connection notification_closed_conn;
    sigc::connection action_invoked_conn;

    const Gio::DBus::InterfaceVTable interface_vtable{sigc::mem_fun(this, &NotificationsDBus::on_interface_method_call)};

    void on_interface_method_call(const Glib::RefPtr<Gio::DBus::Connection> & connection,
        const Glib::ustring & sender,
        const Glib::ustring & object_path, const Glib::ustring & interface_name,
        const Glib::ustring & method_name, const Glib::VariantContainerBase & parameters,
        const Glib::RefPtr<Gio::DBus::MethodInvocation> & invocation);

    dbus_method(GetCapabilities);
    dbus_method(Notify);
    dbus_method(CloseNotification);
    dbus_method(GetServerInformation);

    void on_bus_acquired(const Glib::RefPtr<Gio::DBus::Connection> & connection, const Glib::ustring & name);
    void on_name_acquired(const Glib::RefPtr<Gio::DBus::Connection> & connection, const Glib::ustring & name);
    void on_name_lost(const Glib::RefPtr<Gio::DBus::Connection> & connection, const Glib::ustring & name);
    void register_object();
    void unregister_object();

    void emit_notification_closed(Notification::id_type id, Daemon::CloseReason reason);
    void emit_action_invoked(Notification::id_type id, const Glib::ustring & action_key);
};

#endif
