/**
 * VitaFetch - Image Response
 * Result of a finished image task: either an image or an error
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace vitafetch {

// Encoded image bytes as handed to brls::Image::setImageFromMem
struct ImageData {
    std::vector<uint8_t> bytes;
    std::string url;
};

using Image = std::shared_ptr<const ImageData>;

inline Image makeImage(std::vector<uint8_t> bytes, const std::string& url = "") {
    auto data = std::make_shared<ImageData>();
    data->bytes = std::move(bytes);
    data->url = url;
    return data;
}

enum class ImageErrorCode {
    CANCELLED = 0,
    NO_MANAGER = 1,
    LOAD_FAILED = 2,
    DECODE_FAILED = 3
};

struct ImageError {
    ImageErrorCode code = ImageErrorCode::LOAD_FAILED;
    std::string message;

    static std::string getCodeString(ImageErrorCode code);
};

struct ImageResponseInfo {
    // Served without perceptible latency (e.g. memory cache hit)
    bool isFastResponse = false;
};

class ImageResponse {
public:
    enum class Kind {
        SUCCESS,
        FAILURE
    };

    static ImageResponse success(Image image, ImageResponseInfo info = ImageResponseInfo());
    static ImageResponse failure(ImageErrorCode code, const std::string& message = "");

    Kind getKind() const { return m_kind; }
    bool isSuccess() const { return m_kind == Kind::SUCCESS; }

    // Valid for SUCCESS only
    const Image& getImage() const { return m_image; }
    const ImageResponseInfo& getInfo() const { return m_info; }

    // Valid for FAILURE only
    const ImageError& getError() const { return m_error; }

private:
    ImageResponse() = default;

    Kind m_kind = Kind::FAILURE;
    Image m_image;
    ImageResponseInfo m_info;
    ImageError m_error;
};

} // namespace vitafetch
