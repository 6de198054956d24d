#include <memory>
#include <opencv2/opencv.hpp>
#include <vector>

#include "calibration_engine.hpp"
#include "config.hpp"
#include "coordinate_transformer.hpp"
#include "errors.hpp"
#include "test_utils.hpp"

using namespace cv;
using namespace std;

namespace {

shared_ptr<const CalibrationData> makeCalibration() {
    CalibrationConfig config;
    CalibrationEngine engine(config);
    vector<Point2f> corners = {Point2f(100, 100), Point2f(900, 100), Point2f(900, 500),
                               Point2f(100, 500)};
    return engine.calibrateFromCorners(corners, 0, 0.0, Size(1000, 600));
}

bool mapsCornersAndCentre() {
    auto calibration = makeCalibration();
    CoordinateTransformer transformer(calibration);
    CHECK(transformer.isTransformationAvailable());

    Point2f centre = transformer.pixelToTable(Point2f(500, 300));
    CHECK_NEAR(centre.x, calibration->tableDimensions.width / 2, 1e-3);
    CHECK_NEAR(centre.y, calibration->tableDimensions.height / 2, 1e-3);

    Point2f corner = transformer.tableToPixel(Point2f(0.f, 0.f));
    CHECK_NEAR(corner.x, 100.0, 1e-2);
    CHECK_NEAR(corner.y, 100.0, 1e-2);
    return true;
}

bool pixelRoundTripWithinTolerance() {
    CoordinateTransformer transformer(makeCalibration());
    vector<Point2f> pixels = {Point2f(123.5f, 456.25f), Point2f(777.f, 111.f),
                              Point2f(640.f, 320.f)};
    vector<Point2f> table = transformer.pixelsToTable(pixels);
    vector<Point2f> back = transformer.tableToPixels(table);
    CHECK(back.size() == pixels.size());
    for (size_t i = 0; i < pixels.size(); ++i) {
        CHECK_NEAR(back[i].x, pixels[i].x, 1e-2);
        CHECK_NEAR(back[i].y, pixels[i].y, 1e-2);
    }
    return true;
}

bool trajectoryKeepsLengthAndOrder() {
    CoordinateTransformer transformer(makeCalibration());
    vector<Point2f> trajectory = {Point2f(100, 300), Point2f(300, 300), Point2f(500, 300),
                                  Point2f(700, 300)};
    vector<Point2f> mapped = transformer.transformTrajectory(trajectory);
    CHECK(mapped.size() == trajectory.size());
    for (size_t i = 1; i < mapped.size(); ++i) {
        CHECK(mapped[i].x > mapped[i - 1].x);
    }
    CHECK(transformer.transformTrajectory({}).empty());
    return true;
}

bool onTableBounds() {
    CoordinateTransformer transformer(makeCalibration());
    CHECK(transformer.isOnTable(Point2f(1.f, 0.5f)));
    CHECK(!transformer.isOnTable(Point2f(-0.1f, 0.5f)));
    CHECK(!transformer.isOnTable(Point2f(1.f, 2.f)));
    CHECK(transformer.isOnTable(transformer.pixelToTable(Point2f(500, 300))));
    CHECK(!transformer.isOnTable(transformer.pixelToTable(Point2f(50, 50))));
    return true;
}

bool unavailableCalibrationThrows() {
    CoordinateTransformer missing(nullptr);
    CHECK(!missing.isTransformationAvailable());
    CHECK_THROWS(missing.pixelToTable(Point2f(1, 1)), CoordinateError);
    CHECK_THROWS(missing.tableToPixels({Point2f(1, 1)}), CoordinateError);

    auto invalid = make_shared<CalibrationData>(*makeCalibration());
    invalid->isValid = false;
    CoordinateTransformer stale(invalid);
    CHECK(!stale.isTransformationAvailable());
    CHECK_THROWS(stale.pixelsToTable({Point2f(1, 1)}), CoordinateError);
    CHECK_THROWS(stale.isOnTable(Point2f(1, 1)), SnookerError);
    return true;
}

}  // namespace

int main() {
    return runTests({
        {"mapsCornersAndCentre", mapsCornersAndCentre},
        {"pixelRoundTripWithinTolerance", pixelRoundTripWithinTolerance},
        {"trajectoryKeepsLengthAndOrder", trajectoryKeepsLengthAndOrder},
        {"onTableBounds", onTableBounds},
        {"unavailableCalibrationThrows", unavailableCalibrationThrows},
    });
}
