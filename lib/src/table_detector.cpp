#include "table_detector.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "utilities.hpp"

using namespace std;
using namespace cv;

namespace {

// Smallest angle between two line directions, in [0, pi/2].
double directionDelta(double thetaA, double thetaB) {
    double d = std::fmod(std::abs(thetaA - thetaB), CV_PI);
    return std::min(d, CV_PI - d);
}

}  // namespace

TableDetector::TableDetector(const CalibrationConfig &config)
    : maxDimension(config.processingMaxDimension),
      cannyLow(config.cannyLow),
      cannyHigh(config.cannyHigh),
      houghThreshold(config.houghThreshold),
      angleTolerance(config.lineAngleTolerance * CV_PI / 180.0),
      minSeparation(config.minLineSeparation) {}

bool TableDetector::intersect(const Vec2f &a, const Vec2f &b, Point2f &out) {
    double c1 = std::cos(a[1]), s1 = std::sin(a[1]);
    double c2 = std::cos(b[1]), s2 = std::sin(b[1]);
    double det = c1 * s2 - s1 * c2;
    if (std::abs(det) < 1e-6) return false;
    out.x = static_cast<float>((a[0] * s2 - b[0] * s1) / det);
    out.y = static_cast<float>((c1 * b[0] - c2 * a[0]) / det);
    return true;
}

vector<Vec2f> TableDetector::selectBoundaryPair(const vector<Vec2f> &family, const Point2f &centre,
                                                double minSeparationPx) const {
    if (family.size() < 2) return {};

    const float refTheta = family[0][1];
    auto signedOffset = [&](const Vec2f &line) {
        double offset = centre.x * std::cos(line[1]) + centre.y * std::sin(line[1]) - line[0];
        // (rho, theta) and (-rho, theta + pi) describe the same line with opposite normals.
        return std::abs(line[1] - refTheta) > CV_PI / 2 ? -offset : offset;
    };

    double firstOffset = signedOffset(family[0]);
    for (size_t i = 1; i < family.size(); ++i) {
        if (std::abs(signedOffset(family[i]) - firstOffset) >= minSeparationPx) {
            return {family[0], family[i]};
        }
    }
    return {};
}

vector<Point2f> TableDetector::detect(const Mat &frame, Mat *debugDraw) const {
    lastBoundaryLines.clear();
    int frameMax = std::max(frame.cols, frame.rows);
    if (frame.empty() || frameMax == 0) return {};

    double scale = std::min(1.0, static_cast<double>(maxDimension) / frameMax);
    Mat small;
    if (scale < 1.0) {
        resize(frame, small, Size(), scale, scale, INTER_AREA);
    } else {
        small = frame;
    }

    Mat gray;
    if (small.channels() == 4) {
        cvtColor(small, gray, COLOR_BGRA2GRAY);
    } else if (small.channels() == 3) {
        cvtColor(small, gray, COLOR_BGR2GRAY);
    } else {
        gray = small;
    }

    GaussianBlur(gray, gray, Size(5, 5), 0);
    Mat edges;
    Canny(gray, edges, cannyLow, cannyHigh);
    morphologyEx(edges, edges, MORPH_CLOSE, getStructuringElement(MORPH_RECT, Size(3, 3)));

    // HoughLines reports lines strongest first.
    vector<Vec2f> lines;
    HoughLines(edges, lines, 1, CV_PI / 180, houghThreshold);
    LOGD("[TableDetector] %zu Hough lines at %dx%d", lines.size(), small.cols, small.rows);
    if (lines.size() < 4) return {};

    vector<Vec2f> familyA, familyB;
    for (const auto &line : lines) {
        if (directionDelta(line[1], lines[0][1]) <= angleTolerance) {
            familyA.push_back(line);
        } else {
            familyB.push_back(line);
        }
    }

    Point2f centre(small.cols * 0.5f, small.rows * 0.5f);
    double separationPx = minSeparation * std::min(small.cols, small.rows);
    vector<Vec2f> pairA = selectBoundaryPair(familyA, centre, separationPx);
    vector<Vec2f> pairB = selectBoundaryPair(familyB, centre, separationPx);
    if (pairA.size() != 2 || pairB.size() != 2) {
        LOGD("[TableDetector] Boundary lines not found (family sizes %zu/%zu)", familyA.size(),
             familyB.size());
        return {};
    }

    vector<Point2f> corners;
    for (const auto &a : pairA) {
        for (const auto &b : pairB) {
            Point2f p;
            if (!intersect(a, b, p)) return {};
            corners.push_back(p);
        }
    }
    corners = orderQuad(corners);

    lastBoundaryLines = {pairA[0], pairA[1], pairB[0], pairB[1]};

    if (debugDraw != nullptr) {
        if (small.channels() == 1) {
            cvtColor(small, *debugDraw, COLOR_GRAY2BGR);
        } else if (small.channels() == 4) {
            cvtColor(small, *debugDraw, COLOR_BGRA2BGR);
        } else {
            *debugDraw = small.clone();
        }
        for (int i = 0; i < 4; ++i) {
            line(*debugDraw, corners[i], corners[(i + 1) % 4], Scalar(0, 255, 255), 2);
            circle(*debugDraw, corners[i], 5, Scalar(0, 0, 255), FILLED);
        }
    }

    for (auto &p : corners) {
        p.x = static_cast<float>(p.x / scale);
        p.y = static_cast<float>(p.y / scale);
    }
    return corners;
}
