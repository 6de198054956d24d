#include "quad_analysis.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

#include "utilities.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

using namespace std;
using namespace cv;

bool QuadAnalysis::areLinesParallel(const Point2f& p1, const Point2f& p2, const Point2f& p3,
                                    const Point2f& p4, double epsilon) {
    Point2f dir1 = p2 - p1;
    Point2f dir2 = p4 - p3;

    float len1 = std::sqrt(dir1.x * dir1.x + dir1.y * dir1.y);
    float len2 = std::sqrt(dir2.x * dir2.x + dir2.y * dir2.y);
    if (len1 < 1e-6 || len2 < 1e-6) {
        LOGD("[QuadAnalysis] Degenerate line detected: len1=%.3f, len2=%.3f", len1, len2);
        return false;
    }

    // Parallel lines have |cos| == 1 regardless of direction.
    float absDot = std::abs((dir1.x * dir2.x + dir1.y * dir2.y) / (len1 * len2));
    return 1.0 - absDot < epsilon;
}

double QuadAnalysis::cornerAngle(const Point2f& a, const Point2f& b, const Point2f& c) {
    Point2f e1 = a - b;
    Point2f e2 = c - b;
    double len1 = norm(e1);
    double len2 = norm(e2);
    if (len1 < 1e-6 || len2 < 1e-6) return 0.0;

    double cosAngle = (e1.x * e2.x + e1.y * e2.y) / (len1 * len2);
    cosAngle = std::clamp(cosAngle, -1.0, 1.0);
    return std::acos(cosAngle) * 180.0 / M_PI;
}

bool QuadAnalysis::topBottomParallel(const vector<Point2f>& quad, double epsilon) {
    if (quad.size() != 4) return false;
    return areLinesParallel(quad[0], quad[1], quad[3], quad[2], epsilon);
}

bool QuadAnalysis::leftRightParallel(const vector<Point2f>& quad, double epsilon) {
    if (quad.size() != 4) return false;
    return areLinesParallel(quad[0], quad[3], quad[1], quad[2], epsilon);
}

double QuadAnalysis::getApparentAspectRatio(const vector<Point2f>& quad) {
    if (quad.size() != 4) return 0.0;

    double topLen = norm(quad[1] - quad[0]);
    double bottomLen = norm(quad[2] - quad[3]);
    double leftLen = norm(quad[3] - quad[0]);
    double rightLen = norm(quad[2] - quad[1]);

    double avgVertical = (leftLen + rightLen) / 2.0;
    if (avgVertical < 1e-6) return 0.0;
    return ((topLen + bottomLen) / 2.0) / avgVertical;
}

QuadOrientation QuadAnalysis::orientation(const vector<Point2f>& quad) {
    if (quad.size() != 4) return OTHER;

    bool tbParallel = topBottomParallel(quad);
    bool lrParallel = leftRightParallel(quad);
    double aspect = getApparentAspectRatio(quad);

    double topLeft = cornerAngle(quad[3], quad[0], quad[1]);
    double topRight = cornerAngle(quad[0], quad[1], quad[2]);
    double bottomRight = cornerAngle(quad[1], quad[2], quad[3]);
    double bottomLeft = cornerAngle(quad[2], quad[3], quad[0]);

    LOGD("[QuadAnalysis] tb=%d lr=%d aspect=%.3f angles TL=%.1f TR=%.1f BR=%.1f BL=%.1f",
         tbParallel, lrParallel, aspect, topLeft, topRight, bottomRight, bottomLeft);

    QuadOrientation result = OTHER;
    if (tbParallel && lrParallel) {
        const double kAngleTolerance = 3.0;
        bool rightAngles = std::abs(topLeft - 90.0) < kAngleTolerance &&
                           std::abs(topRight - 90.0) < kAngleTolerance &&
                           std::abs(bottomRight - 90.0) < kAngleTolerance &&
                           std::abs(bottomLeft - 90.0) < kAngleTolerance;
        result = rightAngles ? TOP_DOWN : OTHER;
    } else if (tbParallel) {
        // Far cushion at the top: obtuse top corners, acute bottom corners.
        bool receding = topLeft > 90.0 && topRight > 90.0 && bottomLeft < 90.0 &&
                        bottomRight < 90.0;
        if (aspect >= 1.75) {
            result = LONG_SIDE;
        } else if (receding) {
            result = SHORT_SIDE;
        }
    }

    LOGD("[QuadAnalysis] Orientation: %s", orientationToString(result).c_str());
    return result;
}

string QuadAnalysis::orientationToString(QuadOrientation orientation) {
    switch (orientation) {
        case SHORT_SIDE:
            return "SHORT_SIDE";
        case LONG_SIDE:
            return "LONG_SIDE";
        case TOP_DOWN:
            return "TOP_DOWN";
        case OTHER:
            return "OTHER";
    }
    return "UNKNOWN";
}

bool QuadAnalysis::longSideHorizontal(const vector<Point2f>& quad) {
    switch (orientation(quad)) {
        case SHORT_SIDE:
            return false;
        case LONG_SIDE:
            return true;
        default:
            return getApparentAspectRatio(quad) >= 1.0;
    }
}

double QuadAnalysis::area(const vector<Point2f>& quad) {
    if (quad.size() < 3) return 0.0;
    return std::abs(contourArea(quad));
}

QuadValidation QuadAnalysis::validateTableQuad(const vector<Point2f>& quad, Size imageSize,
                                               double minAreaFraction) {
    QuadValidation result;

    if (quad.size() != 4) {
        result.errorMessage = "expected 4 corners, got " + to_string(quad.size());
        return result;
    }
    for (const auto& p : quad) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            result.errorMessage = "corner is not finite";
            return result;
        }
    }

    result.isConvex = isContourConvex(quad);
    result.area = area(quad);
    if (!result.isConvex) {
        result.errorMessage = "table outline is not convex";
        return result;
    }
    if (result.area < 1e-6) {
        result.errorMessage = "table outline is degenerate";
        return result;
    }

    result.minCornerAngle = 180.0;
    result.maxCornerAngle = 0.0;
    for (int i = 0; i < 4; ++i) {
        double angle = cornerAngle(quad[(i + 3) % 4], quad[i], quad[(i + 1) % 4]);
        result.minCornerAngle = std::min(result.minCornerAngle, angle);
        result.maxCornerAngle = std::max(result.maxCornerAngle, angle);
    }
    if (result.minCornerAngle < 20.0 || result.maxCornerAngle > 160.0) {
        result.errorMessage = "corner angle outside [20, 160] degrees";
        return result;
    }

    if (!imageSize.empty()) {
        double frameArea = static_cast<double>(imageSize.area());
        if (result.area < minAreaFraction * frameArea) {
            result.errorMessage = "table outline covers too little of the frame";
            return result;
        }
        float marginX = imageSize.width * 0.1f;
        float marginY = imageSize.height * 0.1f;
        for (const auto& p : quad) {
            if (p.x < -marginX || p.y < -marginY || p.x > imageSize.width + marginX ||
                p.y > imageSize.height + marginY) {
                result.errorMessage = "corner lies outside the frame";
                return result;
            }
        }
    }

    result.isValid = true;
    return result;
}
