// SPDX-License-Identifier: Apache-2.0
#include "ImageAttachment.hpp"

#include <core/TextUtils.hpp>

#include <openssl/evp.h>

#include <array>
#include <format>
#include <fstream>
#include <iterator>
#include <utility>

namespace agentloop
{

namespace
{
    constexpr auto MimeByExtension = std::array<std::pair<std::string_view, std::string_view>, 6> { {
        { ".png", "image/png" },
        { ".jpg", "image/jpeg" },
        { ".jpeg", "image/jpeg" },
        { ".webp", "image/webp" },
        { ".gif", "image/gif" },
        { ".bmp", "image/bmp" },
    } };
} // namespace

auto imageMimeType(const std::filesystem::path& path) -> std::optional<std::string_view>
{
    auto const extension = text::toLower(path.extension().string());
    for (auto const& [ext, mime]: MimeByExtension)
    {
        if (ext == extension)
            return mime;
    }
    return std::nullopt;
}

auto encodeBase64(std::string_view data) -> std::string
{
    if (data.empty())
        return {};

    // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a terminating NUL.
    auto encoded = std::string(((data.size() + 2) / 3) * 4 + 1, '\0');
    auto const written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                         reinterpret_cast<const unsigned char*>(data.data()),
                                         static_cast<int>(data.size()));
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

auto loadImageAttachment(const std::filesystem::path& path) -> Result<ImageAttachment>
{
    auto const mime = imageMimeType(path);
    if (!mime)
    {
        auto const extension = text::toLower(path.extension().string());
        return makeError(ErrorCode::InvalidArgument,
                         std::format("unsupported image type: {}", extension.empty() ? "unknown" : extension));
    }

    auto file = std::ifstream(path, std::ios::binary);
    if (!file)
        return makeError(ErrorCode::IoError, std::format("cannot read {}", path.string()));

    auto const content = std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (content.empty())
        return makeError(ErrorCode::InvalidArgument, "empty image file");

    return ImageAttachment {
        .path = path,
        .mime = std::string(*mime),
        .dataUrl = std::format("data:{};base64,{}", *mime, encodeBase64(content)),
        .bytes = content.size(),
    };
}

} // namespace agentloop
