#include "utilities.hpp"

#include <cmath>

using namespace std;
using namespace cv;

WarpResult warpTable(const Mat& bgrImg, const Matx33d& pixelToTable, const Size2f& tableDimensions,
                     int outW) {
    double metresToCanvas = (outW - 1) / static_cast<double>(tableDimensions.width);
    int outH = static_cast<int>(round(tableDimensions.height * metresToCanvas)) + 1;

    Matx33d scale(metresToCanvas, 0, 0, 0, metresToCanvas, 0, 0, 0, 1);
    Mat transform = Mat(scale * pixelToTable).clone();

    Mat warped;
    warpPerspective(bgrImg, warped, transform, Size(outW, outH));
    return {warped, transform};
}

vector<Point2f> orderQuad(const vector<Point2f>& pts) {
    vector<Point2f> sortedPts = pts;
    Scalar centroid = mean(pts);
    sort(sortedPts.begin(), sortedPts.end(), [centroid](const Point2f& a, const Point2f& b) {
        return atan2(a.y - centroid[1], a.x - centroid[0]) <
               atan2(b.y - centroid[1], b.x - centroid[0]);
    });
    return sortedPts;
}

double meanPointDistance(const vector<Point2f>& a, const vector<Point2f>& b) {
    if (a.size() != b.size() || a.empty()) return -1.0;
    double total = 0.0;
    for (size_t i = 0; i < a.size(); ++i) total += norm(a[i] - b[i]);
    return total / a.size();
}
