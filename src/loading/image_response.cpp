/**
 * VitaFetch - Image Response implementation
 */

#include "loading/image_response.hpp"

namespace vitafetch {

std::string ImageError::getCodeString(ImageErrorCode code) {
    switch (code) {
        case ImageErrorCode::CANCELLED: return "Cancelled";
        case ImageErrorCode::NO_MANAGER: return "No image manager";
        case ImageErrorCode::LOAD_FAILED: return "Load failed";
        case ImageErrorCode::DECODE_FAILED: return "Decode failed";
        default: return "Unknown";
    }
}

ImageResponse ImageResponse::success(Image image, ImageResponseInfo info) {
    ImageResponse response;
    response.m_kind = Kind::SUCCESS;
    response.m_image = std::move(image);
    response.m_info = info;
    return response;
}

ImageResponse ImageResponse::failure(ImageErrorCode code, const std::string& message) {
    ImageResponse response;
    response.m_kind = Kind::FAILURE;
    response.m_error.code = code;
    response.m_error.message = message.empty() ? ImageError::getCodeString(code) : message;
    return response;
}

} // namespace vitafetch
