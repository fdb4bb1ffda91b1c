#include <gtest/gtest.h>

#include "notification-info.hpp"

namespace
{
using HintMap = std::map<Glib::ustring, Glib::VariantBase>;
using ImageTuple = std::tuple<gint32, gint32, gint32, bool, gint32, gint32, std::vector<guint8>>;

Glib::VariantBase makeImage(gint32 width, gint32 height)
{
    std::vector<guint8> pixels(width * height * 3, 0x80);
    return Glib::Variant<ImageTuple>::create({width, height, width * 3, false, 8, 3, pixels});
}
}

TEST(ParseActions, PairsIdsWithLabelsAndDropsEmptyLabels)
{
    auto actions = parseActions({"a1", "Open", "a2", ""});
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].id, "a1");
    EXPECT_EQ(actions[0].label, "Open");
}

TEST(ParseActions, DropsTrailingIdWithoutLabel)
{
    auto actions = parseActions({"default", "Show", "reply"});
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].id, "default");
}

TEST(ParseActions, KeepsOrder)
{
    auto actions = parseActions({"b", "Second", "a", "First"});
    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].id, "b");
    EXPECT_EQ(actions[1].id, "a");
}

TEST(Urgency, DecodesHintByte)
{
    EXPECT_EQ(decodeUrgency(guint8(0)), Notification::Low);
    EXPECT_EQ(decodeUrgency(guint8(1)), Notification::Normal);
    EXPECT_EQ(decodeUrgency(guint8(2)), Notification::Critical);
    EXPECT_EQ(decodeUrgency(std::nullopt), Notification::Normal);
    EXPECT_EQ(decodeUrgency(guint8(7)), Notification::Normal);
}

TEST(Urgency, Names)
{
    EXPECT_STREQ(urgencyToString(Notification::Low), "low");
    EXPECT_STREQ(urgencyToString(Notification::Critical), "critical");
    EXPECT_EQ(urgencyFromString("normal"), Notification::Normal);
    EXPECT_EQ(urgencyFromString("urgent"), std::nullopt);
}

TEST(NotificationHints, ReadsKnownHints)
{
    HintMap map;
    map["urgency"] = Glib::Variant<guint8>::create(2);
    map["desktop-entry"] = Glib::Variant<Glib::ustring>::create("org.example.Mail");
    map["image-path"]    = Glib::Variant<Glib::ustring>::create("/tmp/picture.png");
    map["image-data"]    = makeImage(2, 2);

    NotificationHints hints(map);
    EXPECT_EQ(hints.urgency, guint8(2));
    EXPECT_EQ(hints.desktop_entry, Glib::ustring("org.example.Mail"));
    EXPECT_EQ(hints.image_path, Glib::ustring("/tmp/picture.png"));
    ASSERT_TRUE(hints.image_data.has_value());
    EXPECT_EQ(hints.image_data->width, 2);
    EXPECT_EQ(hints.image_data->rowstride, 6);
    EXPECT_EQ(hints.image_data->data.size(), 12u);
}

TEST(NotificationHints, AcceptsLegacyImageKey)
{
    HintMap map;
    map["icon_data"] = makeImage(1, 1);

    NotificationHints hints(map);
    EXPECT_TRUE(hints.image_data.has_value());
}

TEST(NotificationHints, IgnoresHintsOfWrongType)
{
    HintMap map;
    map["urgency"]    = Glib::Variant<Glib::ustring>::create("critical");
    map["image-data"] = Glib::Variant<Glib::ustring>::create("not an image");

    NotificationHints hints(map);
    EXPECT_FALSE(hints.urgency.has_value());
    EXPECT_FALSE(hints.image_data.has_value());
    EXPECT_FALSE(hints.desktop_entry.has_value());
}

TEST(NotificationJson, OmitsActionsAndClearsPopup)
{
    Notification notification;
    notification.id = 7;
    notification.app_name = "Mail";
    notification.summary  = "New message";
    notification.actions  = {{"open", "Open"}};
    notification.urgency  = Notification::Critical;
    notification.time     = 1700000000;
    notification.popup    = true;

    auto json = notificationToJson(notification);
    EXPECT_FALSE(json.has_member("actions"));
    EXPECT_FALSE(json.has_member("appEntry"));
    EXPECT_FALSE(json["popup"].as_bool());
    EXPECT_TRUE(json["image"].is_null());
    EXPECT_EQ(json["urgency"].as_string(), "critical");
    EXPECT_EQ(json["time"].as_int64(), 1700000000);
    EXPECT_EQ(json["id"].as_uint(), 7u);
}

TEST(NotificationJson, ReadsCachedNotification)
{
    json_t json;
    ASSERT_FALSE(json_t::parse_string(R"({"id": 12, "appName": "Chat", "appEntry": "org.example.Chat",
        "appIcon": "chat", "summary": "Hi", "body": "there", "urgency": "low", "time": 42,
        "image": "/tmp/Hi12.png", "popup": true})", json).has_value());

    auto notification = notificationFromJson(json);
    EXPECT_EQ(notification.id, 12u);
    EXPECT_EQ(notification.app_name, "Chat");
    EXPECT_EQ(notification.app_entry, Glib::ustring("org.example.Chat"));
    EXPECT_EQ(notification.summary, "Hi");
    EXPECT_EQ(notification.body, "there");
    EXPECT_EQ(notification.urgency, Notification::Low);
    EXPECT_EQ(notification.time, 42);
    EXPECT_EQ(notification.image, std::string("/tmp/Hi12.png"));
    EXPECT_FALSE(notification.popup);
    EXPECT_TRUE(notification.actions.empty());
}

TEST(NotificationJson, RejectsRecordWithoutId)
{
    json_t json;
    ASSERT_FALSE(json_t::parse_string(R"({"appName": "Chat"})", json).has_value());
    EXPECT_THROW(notificationFromJson(json), JSONException);

    ASSERT_FALSE(json_t::parse_string(R"("just a string")", json).has_value());
    EXPECT_THROW(notificationFromJson(json), JSONException);
}
