#ifndef BASE64_UTILS_HPP
#define BASE64_UTILS_HPP

#include <cstddef>
#include <opencv2/core.hpp>
#include <string>

namespace Base64Utils {
    /**
     * Standard base64 with '=' padding.
     */
    std::string encode(const unsigned char* data, size_t len);

    /**
     * PNG-compress an image and base64 it. Empty when the image cannot be encoded.
     */
    std::string encodeMat(const cv::Mat& mat);
}

#endif  // BASE64_UTILS_HPP
