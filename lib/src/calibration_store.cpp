#include "calibration_store.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <opencv2/core.hpp>

#include "utilities.hpp"

using namespace std;
using namespace cv;

namespace fs = std::filesystem;

namespace {

double nowSeconds() {
    return chrono::duration<double>(chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

CalibrationStore::CalibrationStore(string directory, double maxAgeHours)
    : directory(std::move(directory)), maxAgeHours(maxAgeHours) {}

string CalibrationStore::pathFor(const string& cameraId) const {
    string safeId = cameraId;
    for (char& c : safeId) {
        if (!isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') c = '_';
    }
    return (fs::path(directory) / (safeId + ".yml")).string();
}

bool CalibrationStore::save(const CalibrationData& data, const string& cameraId) const {
    if (!data.isValid) return false;
    try {
        fs::create_directories(directory);
        FileStorage file(pathFor(cameraId), FileStorage::WRITE);
        if (!file.isOpened()) {
            LOGE("[CalibrationStore] Cannot open %s for writing", pathFor(cameraId).c_str());
            return false;
        }
        file << "camera_id" << cameraId;
        file << "saved_at" << nowSeconds();
        file << "frame_number" << data.frameNumber;
        file << "timestamp" << data.timestamp;
        file << "homography" << Mat(data.homography);
        file << "table_corners" << data.tableCorners;
        file << "table_length" << data.tableDimensions.width;
        file << "table_width" << data.tableDimensions.height;
        file << "image_width" << data.imageSize.width;
        file << "image_height" << data.imageSize.height;
        file << "reprojection_error" << data.reprojectionError;
        file << "pocket_regions" << "[";
        for (const auto& pocket : data.pocketRegions) {
            file << Vec4f(pocket.x1, pocket.y1, pocket.x2, pocket.y2);
        }
        file << "]";
        file.release();
        return true;
    } catch (const fs::filesystem_error& e) {
        LOGE("[CalibrationStore] %s", e.what());
    } catch (const cv::Exception& e) {
        LOGE("[CalibrationStore] %s", e.what());
    }
    return false;
}

shared_ptr<const CalibrationData> CalibrationStore::load(const string& cameraId) const {
    string path = pathFor(cameraId);
    try {
        if (!fs::exists(path)) return nullptr;

        FileStorage file(path, FileStorage::READ);
        if (!file.isOpened()) return nullptr;

        double savedAt = 0.0;
        file["saved_at"] >> savedAt;
        double ageHours = (nowSeconds() - savedAt) / 3600.0;
        if (ageHours > maxAgeHours) {
            LOGI("[CalibrationStore] Ignoring %s, %.1f hours old", path.c_str(), ageHours);
            return nullptr;
        }

        auto data = make_shared<CalibrationData>();
        Mat homography;
        file["homography"] >> homography;
        if (homography.rows != 3 || homography.cols != 3) return nullptr;
        homography.convertTo(homography, CV_64F);
        data->homography = Matx33d(homography);

        file["table_corners"] >> data->tableCorners;
        if (data->tableCorners.size() != 4) return nullptr;

        file["frame_number"] >> data->frameNumber;
        file["timestamp"] >> data->timestamp;
        float length = 0.f, width = 0.f;
        file["table_length"] >> length;
        file["table_width"] >> width;
        data->tableDimensions = Size2f(length, width);
        file["image_width"] >> data->imageSize.width;
        file["image_height"] >> data->imageSize.height;
        file["reprojection_error"] >> data->reprojectionError;

        FileNode pockets = file["pocket_regions"];
        for (FileNodeIterator it = pockets.begin(); it != pockets.end(); ++it) {
            Vec4f box;
            *it >> box;
            data->pocketRegions.emplace_back(box[0], box[1], box[2], box[3]);
        }

        data->isValid = true;
        LOGI("[CalibrationStore] Loaded calibration for camera %s", cameraId.c_str());
        return data;
    } catch (const fs::filesystem_error& e) {
        LOGW("[CalibrationStore] %s", e.what());
    } catch (const cv::Exception& e) {
        LOGW("[CalibrationStore] Cannot parse %s: %s", path.c_str(), e.what());
    }
    return nullptr;
}
