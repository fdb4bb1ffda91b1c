#include "image-resolver.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include <gdkmm/pixbuf.h>
#include <glibmm/fileutils.h>
#include <wayfire/util/log.hpp>

namespace
{
Glib::RefPtr<Gdk::Pixbuf> pixbufFromImage(const ImageData & image)
{
    if ((image.width <= 0) || (image.height <= 0) || (image.rowstride <= 0))
    {
        throw std::invalid_argument("Cannot create pixbuf from image data: invalid dimensions.");
    }

    // gdk-pixbuf only handles 8 bit RGB and RGBA
    if ((image.bits_per_sample != 8) || (image.channels != (image.has_alpha ? 4 : 3)))
    {
        throw std::invalid_argument("Cannot create pixbuf from image data: unsupported format with " +
            std::to_string(image.channels) + " channels of " + std::to_string(image.bits_per_sample) +
            " bits.");
    }

    const guint64 row_size = (guint64)image.width * image.channels;
    if ((guint64)image.rowstride < row_size)
    {
        throw std::invalid_argument("Cannot create pixbuf from image data: rowstride is too small.");
    }

    if (image.data.size() < ((guint64)image.height - 1) * (guint64)image.rowstride + row_size)
    {
        throw std::invalid_argument(
            "Cannot create pixbuf from image data: not enough data for the given size.");
    }

    auto pixbuf = Gdk::Pixbuf::create_from_data(
        image.data.data(), Gdk::COLORSPACE_RGB, image.has_alpha, image.bits_per_sample,
        image.width, image.height, image.rowstride);
    if (!pixbuf)
    {
        throw std::invalid_argument("Cannot create pixbuf from image data.");
    }

    return pixbuf;
}
} // namespace

ImageResolver::ImageResolver(std::string image_dir) :
    image_dir(std::move(image_dir))
{}

std::string ImageResolver::fileNameFor(const Glib::ustring & key)
{
    std::string name;
    for (char c : key.raw())
    {
        if (((c >= 'a') && (c <= 'z')) || ((c >= 'A') && (c <= 'Z')) || ((c >= '0') && (c <= '9')))
        {
            name += c;
        }
    }

    return name;
}

std::optional<std::string> ImageResolver::resolveFromPayload(const Glib::ustring & key,
    const std::optional<ImageData> & image) const
{
    if (!image)
    {
        return std::nullopt;
    }

    const auto path = image_dir + "/" + fileNameFor(key) + ".png";
    try {
        auto pixbuf = pixbufFromImage(*image);
        std::filesystem::create_directories(image_dir);
        pixbuf->save(path, "png");
    } catch (const std::invalid_argument & err)
    {
        LOGW("Dropping notification image: ", err.what());
        return std::nullopt;
    } catch (const std::filesystem::filesystem_error & err)
    {
        LOGW("Cannot create image directory: ", err.what());
        return std::nullopt;
    } catch (const Glib::Error & err)
    {
        LOGW("Cannot save notification image to ", path, ": ", err.what());
        return std::nullopt;
    }

    return path;
}

std::optional<std::string> ImageResolver::resolveFromPath(const Glib::ustring & path) const
{
    if (!path.empty() && Glib::file_test(path, Glib::FILE_TEST_EXISTS))
    {
        return path.raw();
    }

    return std::nullopt;
}
