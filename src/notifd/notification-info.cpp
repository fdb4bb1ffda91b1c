#include "notification-info.hpp"

#include <tuple>
#include <typeinfo>

#include <wayfire/util/log.hpp>

namespace
{
template<class... T>
void extractValues(const Glib::VariantBase & variant, T&... values)
{
    std::tie(values...) = Glib::VariantBase::cast_dynamic<Glib::Variant<std::tuple<T...>>>(variant).get();
}

template<class K>
std::optional<K> getHint(const std::map<Glib::ustring, Glib::VariantBase> & map, const Glib::ustring & key)
{
    if (map.count(key) != 0)
    {
        const auto & val = map.at(key);
        if (val.is_of_type(Glib::Variant<K>::variant_type()))
        {
            return Glib::VariantBase::cast_dynamic<Glib::Variant<K>>(val).get();
        }

        LOGW("Ignoring hint ", key, " of unexpected type ", val.get_type_string());
    }

    return std::nullopt;
}

std::optional<ImageData> imageFromVariant(const Glib::VariantBase & variant)
{
    ImageData image;
    try {
        extractValues(variant, image.width, image.height, image.rowstride, image.has_alpha,
            image.bits_per_sample, image.channels, image.data);
    } catch (const std::bad_cast&)
    {
        LOGW("Ignoring image data of type ", variant.get_type_string(), ", expected (iiibiiay)");
        return std::nullopt;
    }

    return image;
}

std::optional<ImageData> getImageHint(const std::map<Glib::ustring, Glib::VariantBase> & map)
{
    // image_data and icon_data are the names used by older versions of the protocol
    for (const char *key : {"image-data", "image_data", "icon_data"})
    {
        if (map.count(key) != 0)
        {
            return imageFromVariant(map.at(key));
        }
    }

    return std::nullopt;
}

const char *const urgency_names[] = {"low", "normal", "critical"};
} // namespace

NotificationHints::NotificationHints(const std::map<Glib::ustring, Glib::VariantBase> & map)
{
    image_data = getImageHint(map);
    image_path = getHint<Glib::ustring>(map, "image-path");
    if (!image_path)
    {
        image_path = getHint<Glib::ustring>(map, "image_path");
    }

    desktop_entry = getHint<Glib::ustring>(map, "desktop-entry");
    urgency = getHint<guint8>(map, "urgency");
}

std::vector<Notification::Action> parseActions(const std::vector<Glib::ustring> & actions)
{
    std::vector<Notification::Action> result;
    for (size_t i = 0; i + 1 < actions.size(); i += 2)
    {
        if (!actions[i + 1].empty())
        {
            result.push_back({actions[i], actions[i + 1]});
        }
    }

    return result;
}

Notification::Urgency decodeUrgency(std::optional<guint8> hint)
{
    if (hint && (*hint <= Notification::Critical))
    {
        return static_cast<Notification::Urgency>(*hint);
    }

    return Notification::Normal;
}

const char *urgencyToString(Notification::Urgency urgency)
{
    return urgency_names[decodeUrgency(urgency)];
}

std::optional<Notification::Urgency> urgencyFromString(const std::string & name)
{
    for (guint8 i = Notification::Low; i <= Notification::Critical; i++)
    {
        if (name == urgency_names[i])
        {
            return static_cast<Notification::Urgency>(i);
        }
    }

    return std::nullopt;
}

json_t notificationToJson(const Notification & notification)
{
    json_t json;
    json["id"] = notification.id;
    json["appName"] = notification.app_name.raw();
    if (notification.app_entry)
    {
        json["appEntry"] = notification.app_entry->raw();
    }

    json["appIcon"] = notification.app_icon.raw();
    json["summary"] = notification.summary.raw();
    json["body"]    = notification.body.raw();
    json["urgency"] = urgencyToString(notification.urgency);
    json["time"]    = notification.time;
    if (notification.image)
    {
        json["image"] = *notification.image;
    } else
    {
        json["image"] = nullptr;
    }

    json["popup"] = false;
    return json;
}

namespace
{
Glib::ustring getString(const json_reference_t & json, const char *key)
{
    if (json.has_member(key) && json[key].is_string())
    {
        return json[key].as_string();
    }

    return {};
}
} // namespace

Notification notificationFromJson(const json_reference_t & json)
{
    if (!json.is_object())
    {
        throw JSONException("Cached notification is not an object");
    }

    if (!json.has_member("id") || !json["id"].is_uint())
    {
        throw JSONException("Cached notification has no valid id");
    }

    Notification notification;
    notification.id = json["id"].as_uint();
    notification.app_name = getString(json, "appName");
    if (json.has_member("appEntry") && json["appEntry"].is_string())
    {
        notification.app_entry = json["appEntry"].as_string();
    }

    notification.app_icon = getString(json, "appIcon");
    notification.summary  = getString(json, "summary");
    notification.body     = getString(json, "body");
    notification.urgency  = urgencyFromString(getString(json, "urgency").raw()).value_or(Notification::Normal);
    if (json.has_member("time") && json["time"].is_int64())
    {
        notification.time = json["time"].as_int64();
    }

    if (json.has_member("image") && json["image"].is_string())
    {
        notification.image = json["image"].as_string();
    }

    notification.popup = false;
    return notification;
}
