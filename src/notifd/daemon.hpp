#ifndef NOTIFICATION_DAEMON_HPP
#define NOTIFICATION_DAEMON_HPP

#include "image-resolver.hpp"
#include "notification-info.hpp"
#include "notification-store.hpp"
#include "timeout-scheduler.hpp"

#include <map>
#include <string>
#include <vector>

#include <sigc++/signal.h>

/**
 * Keeps track of all live notifications and drives their lifecycle:
 * a notification is created by notify(), stops being a popup when it is
 * dismissed (explicitly or after the popup timeout), and is gone once it is
 * closed or one of its actions is invoked.
 *
 * All methods are meant to be called from the main loop.
 */
class Daemon
{
  public:
    enum CloseReason : guint32
    {
        Expired      = 1,
        Dismissed    = 2,
        MethodCalled = 3,
        Undefined    = 4,
    };

    struct ServerInformation
    {
        Glib::ustring name;
        Glib::ustring vendor;
        Glib::ustring version;
        Glib::ustring spec_version;
    };

    using notification_signal = sigc::signal<void (Notification::id_type)>;
    using changed_signal = sigc::signal<void ()>;
    using closed_signal  = sigc::signal<void (Notification::id_type, CloseReason)>;
    using action_signal  = sigc::signal<void (Notification::id_type, const Glib::ustring&)>;

    static constexpr guint DEFAULT_POPUP_TIMEOUT = 3000;

    /*!
     * Creates the daemon and restores the notifications cached in @store.
     */
    Daemon(NotificationStore & store, ImageResolver & images, TimeoutScheduler & scheduler,
        guint popup_timeout = DEFAULT_POPUP_TIMEOUT);
    ~Daemon();

    Daemon(const Daemon &) = delete;
    Daemon & operator =(const Daemon &) = delete;

    /*!
     * Adds a notification, or replaces the one with id @replaces_id if it is
     * not 0. Returns the id of the notification.
     */
    Notification::id_type notify(const Glib::ustring & app_name, Notification::id_type replaces_id,
        const Glib::ustring & app_icon, const Glib::ustring & summary, const Glib::ustring & body,
        const std::vector<Glib::ustring> & actions, const NotificationHints & hints);

    void dismissNotification(Notification::id_type id);
    void closeNotification(Notification::id_type id);
    void invokeAction(Notification::id_type id, const Glib::ustring & action_key);

    /*!
     * Closes all notifications.
     */
    void clear();

    std::vector<Glib::ustring> getCapabilities() const;
    ServerInformation getServerInformation() const;

    const std::map<Notification::id_type, Notification> & getNotifications() const;

    /*!
     * The notifications which should currently be shown as popups.
     */
    std::map<Notification::id_type, Notification> getPopups() const;

    bool getDnd() const;
    void setDnd(bool dnd);

    guint getPopupTimeout() const;
    void setPopupTimeout(guint timeout_ms);

    notification_signal signalNotified()
    {
        return signal_notified;
    }

    notification_signal signalDismissed()
    {
        return signal_dismissed;
    }

    notification_signal signalClosed()
    {
        return signal_closed;
    }

    changed_signal signalChanged()
    {
        return signal_changed;
    }

    /// Emitted before a notification is closed, with the reason to report to clients.
    closed_signal signalNotificationClosed()
    {
        return signal_notification_closed;
    }

    /// Emitted before the notification whose action was invoked is closed.
    action_signal signalActionInvoked()
    {
        return signal_action_invoked;
    }

  private:
    struct PendingDismiss
    {
        sigc::connection timer;
        guint64 generation;
    };

    NotificationStore & store;
    ImageResolver & images;
    TimeoutScheduler & scheduler;

    std::map<Notification::id_type, Notification> notifications;
    std::map<Notification::id_type, PendingDismiss> pending_dismiss;
    Notification::id_type next_id = 1;
    guint64 next_generation = 0;
    guint popup_timeout;
    bool dnd = false;

    notification_signal signal_notified;
    notification_signal signal_dismissed;
    notification_signal signal_closed;
    changed_signal signal_changed;
    closed_signal signal_notification_closed;
    action_signal signal_action_invoked;

    void restore();
    void cache();
    void scheduleDismiss(Notification::id_type id);
    void cancelDismiss(Notification::id_type id);
    std::optional<std::string> resolveImage(Notification::id_type id, const Glib::ustring & summary,
        const Glib::ustring & app_icon, const NotificationHints & hints) const;
};

#endif
