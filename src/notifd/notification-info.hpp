#ifndef NOTIFICATION_INFO_HPP
#define NOTIFICATION_INFO_HPP

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <glibmm/ustring.h>
#include <glibmm/variant.h>

#include "json.hpp"

struct Notification
{
    using id_type = guint32;

    enum Urgency : guint8
    {
        Low      = 0,
        Normal   = 1,
        Critical = 2,
    };

    struct Action
    {
        Glib::ustring id;
        Glib::ustring label;
    };

    id_type id = 0;
    Glib::ustring app_name;
    std::optional<Glib::ustring> app_entry;
    Glib::ustring app_icon;
    Glib::ustring summary;
    Glib::ustring body;
    std::vector<Action> actions;
    Urgency urgency = Normal;
    /// when the notification was received, unix time
    gint64 time = 0;
    /// path of the image shown with the notification
    std::optional<std::string> image;
    /// whether the notification should still be shown as a popup
    bool popup = false;
};

/**
 * Raw pixel data as carried by the `image-data` hint, signature (iiibiiay).
 */
struct ImageData
{
    gint32 width;
    gint32 height;
    gint32 rowstride;
    bool has_alpha;
    gint32 bits_per_sample;
    gint32 channels;
    std::vector<guint8> data;
};

/**
 * The hints of a Notify call that the daemon understands.
 */
struct NotificationHints
{
    std::optional<ImageData> image_data;
    std::optional<Glib::ustring> image_path;
    std::optional<Glib::ustring> desktop_entry;
    std::optional<guint8> urgency;

    NotificationHints() = default;

    /*!
     * Decodes the a{sv} hints dictionary of a Notify call.
     * Hints of an unexpected type are ignored.
     */
    explicit NotificationHints(const std::map<Glib::ustring, Glib::VariantBase> & map);
};

/*!
 * Pairs up the flat [id, label, id, label, ...] list of a Notify call.
 * Actions without a label and a trailing id without a label are dropped.
 */
std::vector<Notification::Action> parseActions(const std::vector<Glib::ustring> & actions);

/*!
 * Decodes the urgency hint, anything but 0, 1 or 2 is Normal.
 */
Notification::Urgency decodeUrgency(std::optional<guint8> hint);

const char *urgencyToString(Notification::Urgency urgency);
std::optional<Notification::Urgency> urgencyFromString(const std::string & name);

/*!
 * JSON representation used by the notification cache.
 * Actions are not part of it and the popup flag is always false.
 */
json_t notificationToJson(const Notification & notification);

/*!
 * Reads a cached notification back.
 * Throws JSONException if the value is not an object or has no valid id.
 */
Notification notificationFromJson(const json_reference_t & json);

#endif
