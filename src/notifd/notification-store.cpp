#include "notification-store.hpp"

#include <filesystem>
#include <utility>

#include <glibmm/fileutils.h>
#include <wayfire/util/log.hpp>

NotificationStore::NotificationStore(std::string cache_file) :
    cache_file(std::move(cache_file))
{}

std::vector<Notification> NotificationStore::load() const
{
    std::string contents;
    try {
        contents = Glib::file_get_contents(cache_file);
    } catch (const Glib::FileError & err)
    {
        if (err.code() != Glib::FileError::NO_SUCH_ENTITY)
        {
            LOGE("Cannot read notification cache: ", err.what());
        }

        return {};
    }

    json_t json;
    auto error = json_t::parse_string(contents, json);
    if (!error && !json.is_array())
    {
        error = "not a list of notifications";
    }

    if (error)
    {
        const auto corrupt_file = cache_file + ".corrupt";
        LOGE("Malformed notification cache ", cache_file, ": ", *error, ", moving it to ", corrupt_file);
        std::error_code ec;
        std::filesystem::rename(cache_file, corrupt_file, ec);
        if (ec)
        {
            LOGE("Cannot move ", cache_file, " aside: ", ec.message());
        }

        return {};
    }

    std::vector<Notification> notifications;
    for (size_t i = 0; i < json.size(); i++)
    {
        try {
            auto notification = notificationFromJson(json[i]);
            notification.popup = false;
            notifications.push_back(std::move(notification));
        } catch (const JSONException & err)
        {
            LOGW("Skipping cached notification #", i, ": ", err.what());
        }
    }

    return notifications;
}

void NotificationStore::save(const std::map<Notification::id_type, Notification> & notifications) const
{
    auto json = json_t::array();
    for (const auto & [id, notification] : notifications)
    {
        json.append(notificationToJson(notification));
    }

    const auto directory = std::filesystem::path(cache_file).parent_path();
    if (!directory.empty())
    {
        std::filesystem::create_directories(directory);
    }

    // writes to a temporary file first and renames it over the cache
    Glib::file_set_contents(cache_file, json.serialize(true));
}
