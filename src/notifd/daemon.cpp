#include "daemon.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>

#include <glibmm/error.h>
#include <wayfire/util/log.hpp>

Daemon::Daemon(NotificationStore & store, ImageResolver & images, TimeoutScheduler & scheduler,
    guint popup_timeout) :
    store(store), images(images), scheduler(scheduler), popup_timeout(popup_timeout)
{
    restore();
}

Daemon::~Daemon()
{
    for (auto & [id, pending] : pending_dismiss)
    {
        pending.timer.disconnect();
    }
}

void Daemon::restore()
{
    for (auto & notification : store.load())
    {
        const auto id = notification.id;
        next_id = std::max(next_id, id + 1);
        notification.popup = false;
        notifications[id] = std::move(notification);
    }

    LOGI("Restored ", notifications.size(), " cached notifications");
    signal_changed.emit();
}

void Daemon::cache()
{
    try {
        store.save(notifications);
    } catch (const Glib::Error & err)
    {
        LOGE("Failed to write notification cache ", store.getCacheFile(), ": ", err.what());
    } catch (const std::filesystem::filesystem_error & err)
    {
        LOGE("Failed to write notification cache ", store.getCacheFile(), ": ", err.what());
    }
}

std::optional<std::string> Daemon::resolveImage(Notification::id_type id, const Glib::ustring & summary,
    const Glib::ustring & app_icon, const NotificationHints & hints) const
{
    if (auto image = images.resolveFromPayload(summary.raw() + std::to_string(id), hints.image_data))
    {
        return image;
    }

    if (hints.image_path)
    {
        if (auto image = images.resolveFromPath(*hints.image_path))
        {
            return image;
        }
    }

    return images.resolveFromPath(app_icon);
}

Notification::id_type Daemon::notify(const Glib::ustring & app_name, Notification::id_type replaces_id,
    const Glib::ustring & app_icon, const Glib::ustring & summary, const Glib::ustring & body,
    const std::vector<Glib::ustring> & actions, const NotificationHints & hints)
{
    Notification::id_type id;
    if (replaces_id != 0)
    {
        id = replaces_id;
        if (notifications.count(id) == 0)
        {
            // never hand out an id a client picked itself
            next_id = std::max(next_id, id + 1);
        }
    } else
    {
        id = next_id++;
    }

    Notification notification;
    notification.id = id;
    notification.app_name  = app_name;
    notification.app_entry = hints.desktop_entry;
    notification.app_icon  = app_icon;
    notification.summary   = summary;
    notification.body = body;
    notification.actions = parseActions(actions);
    notification.urgency = decodeUrgency(hints.urgency);
    notification.time    = std::time(nullptr);
    notification.image   = resolveImage(id, summary, app_icon, hints);
    notification.popup   = !dnd;

    LOGD("Notification ", id, (replaces_id != 0) ? " replaced" : " added", " by ", app_name);
    notifications[id] = std::move(notification);
    scheduleDismiss(id);

    cache();
    signal_notified.emit(id);
    signal_changed.emit();
    return id;
}

void Daemon::dismissNotification(Notification::id_type id)
{
    auto it = notifications.find(id);
    if (it == notifications.end())
    {
        return;
    }

    it->second.popup = false;
    signal_dismissed.emit(id);
    signal_changed.emit();
}

void Daemon::closeNotification(Notification::id_type id)
{
    if (notifications.count(id) == 0)
    {
        return;
    }

    signal_notification_closed.emit(id, CloseReason::MethodCalled);
    notifications.erase(id);
    cancelDismiss(id);
    signal_closed.emit(id);
    signal_changed.emit();
    cache();
}

void Daemon::invokeAction(Notification::id_type id, const Glib::ustring & action_key)
{
    if (notifications.count(id) == 0)
    {
        return;
    }

    signal_action_invoked.emit(id, action_key);
    closeNotification(id);
}

void Daemon::clear()
{
    std::vector<Notification::id_type> ids;
    for (const auto & [id, _] : notifications)
    {
        ids.push_back(id);
    }

    for (auto id : ids)
    {
        closeNotification(id);
    }
}

void Daemon::scheduleDismiss(Notification::id_type id)
{
    cancelDismiss(id);

    const auto generation = next_generation++;
    auto timer = scheduler.schedule(popup_timeout, [this, id, generation] ()
    {
        auto it = pending_dismiss.find(id);
        if ((it == pending_dismiss.end()) || (it->second.generation != generation))
        {
            return;
        }

        pending_dismiss.erase(it);
        dismissNotification(id);
    });

    pending_dismiss[id] = {timer, generation};
}

void Daemon::cancelDismiss(Notification::id_type id)
{
    auto it = pending_dismiss.find(id);
    if (it != pending_dismiss.end())
    {
        it->second.timer.disconnect();
        pending_dismiss.erase(it);
    }
}

std::vector<Glib::ustring> Daemon::getCapabilities() const
{
    return {"actions", "body", "icon-static", "persistence"};
}

Daemon::ServerInformation Daemon::getServerInformation() const
{
    return {"wf-notifd", "wayfire.org", WF_NOTIFD_VERSION, "1.2"};
}

const std::map<Notification::id_type, Notification>& Daemon::getNotifications() const
{
    return notifications;
}

std::map<Notification::id_type, Notification> Daemon::getPopups() const
{
    std::map<Notification::id_type, Notification> popups;
    for (const auto & [id, notification] : notifications)
    {
        if (notification.popup)
        {
            popups.insert({id, notification});
        }
    }

    return popups;
}

bool Daemon::getDnd() const
{
    return dnd;
}

void Daemon::setDnd(bool dnd)
{
    if (this->dnd == dnd)
    {
        return;
    }

    this->dnd = dnd;
    LOGI("Do not disturb ", dnd ? "enabled" : "disabled");
    signal_changed.emit();
}

guint Daemon::getPopupTimeout() const
{
    return popup_timeout;
}

void Daemon::setPopupTimeout(guint timeout_ms)
{
    popup_timeout = timeout_ms;
}
