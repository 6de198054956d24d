#include "base64_utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <vector>

namespace Base64Utils {

    static const char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";

    std::string encode(const unsigned char* data, size_t len) {
        std::string out;
        out.reserve(((len + 2) / 3) * 4);

        size_t i = 0;
        for (; i + 2 < len; i += 3) {
            unsigned int group = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
            out += kAlphabet[(group >> 18) & 0x3f];
            out += kAlphabet[(group >> 12) & 0x3f];
            out += kAlphabet[(group >> 6) & 0x3f];
            out += kAlphabet[group & 0x3f];
        }

        size_t remaining = len - i;
        if (remaining > 0) {
            unsigned int group = data[i] << 16;
            if (remaining == 2) group |= data[i + 1] << 8;
            out += kAlphabet[(group >> 18) & 0x3f];
            out += kAlphabet[(group >> 12) & 0x3f];
            out += remaining == 2 ? kAlphabet[(group >> 6) & 0x3f] : '=';
            out += '=';
        }
        return out;
    }

    std::string encodeMat(const cv::Mat& mat) {
        if (mat.empty()) return "";

        std::vector<uchar> png;
        std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, 6};
        if (!cv::imencode(".png", mat, png, params)) {
            return "";
        }
        return encode(png.data(), png.size());
    }
}
