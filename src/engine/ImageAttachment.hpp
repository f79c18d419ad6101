// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace agentloop
{

/// @brief An image file encoded for an `image_url` content block.
struct ImageAttachment
{
    std::filesystem::path path;
    std::string mime;
    std::string dataUrl; // data:<mime>;base64,...
    std::size_t bytes = 0;
};

/// @brief MIME type for a file extension (.png, .jpg, .jpeg, .webp, .gif, .bmp), case-insensitive.
[[nodiscard]] auto imageMimeType(const std::filesystem::path& path) -> std::optional<std::string_view>;

/// @brief Base64 encoding (RFC 4648, with padding).
[[nodiscard]] auto encodeBase64(std::string_view data) -> std::string;

/// @brief Reads an image file and encodes it as a data URL.
/// @return The attachment, or InvalidArgument for an unsupported or empty
///         file and IoError when it cannot be read.
[[nodiscard]] auto loadImageAttachment(const std::filesystem::path& path) -> Result<ImageAttachment>;

} // namespace agentloop
