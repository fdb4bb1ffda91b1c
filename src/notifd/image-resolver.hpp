#ifndef NOTIFICATION_IMAGE_RESOLVER_HPP
#define NOTIFICATION_IMAGE_RESOLVER_HPP

#include "notification-info.hpp"

#include <optional>
#include <string>

/**
 * Turns the image of a notification into a file on disk which can be shown
 * later, also after a restart.
 */
class ImageResolver
{
  public:
    /*!
     * @image_dir Directory where decoded image data is stored, created when needed.
     */
    explicit ImageResolver(std::string image_dir);

    /*!
     * Saves @image as PNG in the image directory under a name derived from @key.
     *
     * Returns the path of the saved file, or std::nullopt if there is no image
     * or it could not be decoded or written.
     */
    std::optional<std::string> resolveFromPayload(const Glib::ustring & key,
        const std::optional<ImageData> & image) const;

    /*!
     * Returns @path if it names an existing file.
     */
    std::optional<std::string> resolveFromPath(const Glib::ustring & path) const;

    /*!
     * Strips everything but ASCII letters and digits from @key.
     */
    static std::string fileNameFor(const Glib::ustring & key);

    const std::string & getImageDir() const
    {
        return image_dir;
    }

  private:
    std::string image_dir;
};

#endif
