#include <gtest/gtest.h>

#include <filesystem>

#include <gdkmm/pixbuf.h>
#include <glibmm/fileutils.h>

#include "image-resolver.hpp"
#include "temp-dir.hpp"

namespace
{
ImageData makeRgbImage(gint32 width, gint32 height)
{
    ImageData image;
    image.width     = width;
    image.height    = height;
    image.rowstride = width * 3;
    image.has_alpha = false;
    image.bits_per_sample = 8;
    image.channels = 3;
    image.data.assign(width * height * 3, 0x40);
    return image;
}
}

TEST(ImageResolver, FileNameKeepsOnlyLettersAndDigits)
{
    EXPECT_EQ(ImageResolver::fileNameFor("New mail! (3)12"), "Newmail312");
    EXPECT_EQ(ImageResolver::fileNameFor("../../etc/passwd"), "etcpasswd");
    EXPECT_EQ(ImageResolver::fileNameFor("Grüße 7"), "Gre7");
    EXPECT_EQ(ImageResolver::fileNameFor(""), "");
}

TEST(ImageResolver, NoPayloadResolvesToNothing)
{
    TempDir dir;
    ImageResolver resolver(dir.file("images"));
    EXPECT_FALSE(resolver.resolveFromPayload("summary1", std::nullopt).has_value());
    EXPECT_FALSE(std::filesystem::exists(dir.file("images")));
}

TEST(ImageResolver, SavesPayloadAsPng)
{
    TempDir dir;
    ImageResolver resolver(dir.file("images"));

    auto path = resolver.resolveFromPayload("Build done 4", makeRgbImage(2, 1));
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, dir.file("images/Builddone4.png"));
    ASSERT_TRUE(std::filesystem::exists(*path));

    auto pixbuf = Gdk::Pixbuf::create_from_file(*path);
    EXPECT_EQ(pixbuf->get_width(), 2);
    EXPECT_EQ(pixbuf->get_height(), 1);
}

TEST(ImageResolver, RejectsTruncatedPayload)
{
    TempDir dir;
    ImageResolver resolver(dir.file("images"));

    auto image = makeRgbImage(4, 4);
    image.data.resize(10);
    EXPECT_FALSE(resolver.resolveFromPayload("truncated", image).has_value());
    EXPECT_FALSE(std::filesystem::exists(dir.file("images/truncated.png")));
}

TEST(ImageResolver, RejectsInvalidDimensions)
{
    TempDir dir;
    ImageResolver resolver(dir.file("images"));

    auto image = makeRgbImage(2, 2);
    image.width = 0;
    EXPECT_FALSE(resolver.resolveFromPayload("empty", image).has_value());
}

TEST(ImageResolver, ResolvesExistingPaths)
{
    TempDir dir;
    ImageResolver resolver(dir.file("images"));
    Glib::file_set_contents(dir.file("icon.png"), "not really a png");

    EXPECT_EQ(resolver.resolveFromPath(dir.file("icon.png")), dir.file("icon.png"));
    EXPECT_FALSE(resolver.resolveFromPath(dir.file("missing.png")).has_value());
    EXPECT_FALSE(resolver.resolveFromPath("").has_value());
}

TEST(ImageResolver, SavesRgbaPayload)
{
    TempDir dir;
    ImageResolver resolver(dir.file("images"));

    auto image = makeRgbImage(3, 2);
    image.has_alpha = true;
    image.channels  = 4;
    image.rowstride = 3 * 4;
    image.data.assign(3 * 4 * 2, 0xff);

    auto path = resolver.resolveFromPayload("rgba", image);
    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(Gdk::Pixbuf::create_from_file(*path)->get_has_alpha());
}

TEST(ImageResolver, RejectsSixteenBitSamples)
{
    TempDir dir;
    ImageResolver resolver(dir.file("images"));

    auto image = makeRgbImage(1, 1);
    image.bits_per_sample = 16;
    image.rowstride = 6;
    image.data.assign(6, 0x10);
    EXPECT_FALSE(resolver.resolveFromPayload("deep", image).has_value());
    EXPECT_FALSE(std::filesystem::exists(dir.file("images/deep.png")));
}

TEST(ImageResolver, RejectsChannelsDisagreeingWithAlpha)
{
    TempDir dir;
    ImageResolver resolver(dir.file("images"));

    auto image = makeRgbImage(2, 2);
    image.has_alpha = true;
    EXPECT_FALSE(resolver.resolveFromPayload("alpha", image).has_value());

    image = makeRgbImage(2, 2);
    image.channels = 4;
    EXPECT_FALSE(resolver.resolveFromPayload("channels", image).has_value());
}

TEST(ImageResolver, RejectsRowstrideShorterThanRow)
{
    TempDir dir;
    ImageResolver resolver(dir.file("images"));

    auto image = makeRgbImage(4, 2);
    image.rowstride = 4;
    EXPECT_FALSE(resolver.resolveFromPayload("narrow", image).has_value());
}

TEST(ImageResolver, RejectsHugeDimensionsWithoutOverflow)
{
    TempDir dir;
    ImageResolver resolver(dir.file("images"));

    auto image = makeRgbImage(1, 1);
    image.width     = G_MAXINT32;
    image.height    = G_MAXINT32;
    image.rowstride = G_MAXINT32;
    EXPECT_FALSE(resolver.resolveFromPayload("huge", image).has_value());
}
