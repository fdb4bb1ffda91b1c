#include <gtest/gtest.h>

#include <filesystem>

#include <glibmm/fileutils.h>

#include "notification-store.hpp"
#include "temp-dir.hpp"

namespace
{
Notification makeNotification(Notification::id_type id, const Glib::ustring & summary)
{
    Notification notification;
    notification.id = id;
    notification.app_name = "Mail";
    notification.app_icon = "mail-unread";
    notification.summary  = summary;
    notification.body     = "Body of " + summary;
    notification.actions  = {{"default", "Open"}};
    notification.urgency  = Notification::Critical;
    notification.time     = 1234;
    notification.popup    = true;
    return notification;
}
}

TEST(NotificationStore, MissingCacheIsEmpty)
{
    TempDir dir;
    NotificationStore store(dir.file("notifications.json"));
    EXPECT_TRUE(store.load().empty());
    EXPECT_FALSE(std::filesystem::exists(dir.file("notifications.json.corrupt")));
}

TEST(NotificationStore, SavedNotificationsLoadBack)
{
    TempDir dir;
    NotificationStore store(dir.file("notifications.json"));

    std::map<Notification::id_type, Notification> notifications;
    notifications[3] = makeNotification(3, "first");
    notifications[5] = makeNotification(5, "second");
    notifications[5].app_entry = Glib::ustring("org.example.Mail");
    notifications[5].image     = std::string("/tmp/second5.png");
    store.save(notifications);

    auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].id, 3u);
    EXPECT_EQ(loaded[0].summary, "first");
    EXPECT_FALSE(loaded[0].app_entry.has_value());
    EXPECT_FALSE(loaded[0].image.has_value());

    EXPECT_EQ(loaded[1].id, 5u);
    EXPECT_EQ(loaded[1].app_name, "Mail");
    EXPECT_EQ(loaded[1].app_icon, "mail-unread");
    EXPECT_EQ(loaded[1].body, "Body of second");
    EXPECT_EQ(loaded[1].app_entry, Glib::ustring("org.example.Mail"));
    EXPECT_EQ(loaded[1].image, std::string("/tmp/second5.png"));
    EXPECT_EQ(loaded[1].urgency, Notification::Critical);
    EXPECT_EQ(loaded[1].time, 1234);

    for (const auto & notification : loaded)
    {
        EXPECT_FALSE(notification.popup);
        EXPECT_TRUE(notification.actions.empty());
    }
}

TEST(NotificationStore, CacheFileHasNoActions)
{
    TempDir dir;
    NotificationStore store(dir.file("notifications.json"));
    store.save({{1, makeNotification(1, "hello")}});

    json_t json;
    ASSERT_FALSE(json_t::parse_string(Glib::file_get_contents(dir.file("notifications.json")), json).has_value());
    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 1u);

    const size_t first = 0;
    EXPECT_FALSE(json[first].has_member("actions"));
    EXPECT_FALSE(json[first]["popup"].as_bool());
    EXPECT_EQ(json[first]["summary"].as_string(), "hello");
}

TEST(NotificationStore, EmptyRegistryWritesEmptyList)
{
    TempDir dir;
    NotificationStore store(dir.file("notifications.json"));
    store.save({{1, makeNotification(1, "hello")}});
    store.save({});

    EXPECT_TRUE(store.load().empty());
    json_t json;
    ASSERT_FALSE(json_t::parse_string(Glib::file_get_contents(dir.file("notifications.json")), json).has_value());
    EXPECT_TRUE(json.is_array());
    EXPECT_EQ(json.size(), 0u);
}

TEST(NotificationStore, MalformedCacheIsMovedAside)
{
    TempDir dir;
    Glib::file_set_contents(dir.file("notifications.json"), "[{\"id\": 1, ");

    NotificationStore store(dir.file("notifications.json"));
    EXPECT_TRUE(store.load().empty());
    EXPECT_FALSE(std::filesystem::exists(dir.file("notifications.json")));
    EXPECT_TRUE(std::filesystem::exists(dir.file("notifications.json.corrupt")));
}

TEST(NotificationStore, CacheWhichIsNotAListIsMovedAside)
{
    TempDir dir;
    Glib::file_set_contents(dir.file("notifications.json"), "{\"id\": 1}");

    NotificationStore store(dir.file("notifications.json"));
    EXPECT_TRUE(store.load().empty());
    EXPECT_TRUE(std::filesystem::exists(dir.file("notifications.json.corrupt")));
}

TEST(NotificationStore, SkipsRecordsWithoutId)
{
    TempDir dir;
    Glib::file_set_contents(dir.file("notifications.json"),
        R"([{"summary": "no id"}, 17, {"id": 4, "summary": "kept", "urgency": "bogus"}])");

    NotificationStore store(dir.file("notifications.json"));
    auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].id, 4u);
    EXPECT_EQ(loaded[0].summary, "kept");
    EXPECT_EQ(loaded[0].urgency, Notification::Normal);
}

TEST(NotificationStore, CreatesCacheDirectory)
{
    TempDir dir;
    NotificationStore store(dir.file("nested/deeper/notifications.json"));
    store.save({{2, makeNotification(2, "nested")}});

    EXPECT_TRUE(std::filesystem::exists(dir.file("nested/deeper/notifications.json")));
    ASSERT_EQ(store.load().size(), 1u);
}
