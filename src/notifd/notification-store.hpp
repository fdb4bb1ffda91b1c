#ifndef NOTIFICATION_STORE_HPP
#define NOTIFICATION_STORE_HPP

#include "notification-info.hpp"

#include <map>
#include <string>
#include <vector>

/**
 * The on-disk cache which lets notifications survive a restart of the daemon.
 */
class NotificationStore
{
  public:
    explicit NotificationStore(std::string cache_file);

    /*!
     * Reads the cached notifications. A missing or unreadable cache yields no
     * notifications, a malformed one is moved aside to `<cache file>.corrupt`.
     * All returned notifications have their popup flag cleared.
     */
    std::vector<Notification> load() const;

    /*!
     * Replaces the cache with @notifications.
     *
     * Throws Glib::FileError or std::filesystem::filesystem_error if the
     * cache could not be written.
     */
    void save(const std::map<Notification::id_type, Notification> & notifications) const;

    const std::string & getCacheFile() const
    {
        return cache_file;
    }

  private:
    std::string cache_file;
};

#endif
