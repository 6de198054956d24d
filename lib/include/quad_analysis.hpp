#ifndef QUAD_ANALYSIS_HPP
#define QUAD_ANALYSIS_HPP

#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Camera viewpoint implied by the table outline.
enum QuadOrientation { SHORT_SIDE, LONG_SIDE, TOP_DOWN, OTHER };

struct QuadValidation {
    bool isValid = false;
    bool isConvex = false;
    double area = 0.0;
    double minCornerAngle = 0.0;
    double maxCornerAngle = 0.0;
    std::string errorMessage;
};

class QuadAnalysis {
   public:
    /**
     * Check if top and bottom lines of quad are parallel within epsilon tolerance
     * @param quad Quadrilateral points ordered TL, TR, BR, BL
     * @param epsilon Tolerance on 1 - |cos| of the angle between the lines
     */
    static bool topBottomParallel(const std::vector<cv::Point2f>& quad, double epsilon = 0.0038);

    /**
     * Check if left and right lines of quad are parallel within epsilon tolerance
     * @param quad Quadrilateral points ordered TL, TR, BR, BL
     * @param epsilon Tolerance on 1 - |cos| of the angle between the lines
     */
    static bool leftRightParallel(const std::vector<cv::Point2f>& quad, double epsilon = 0.0038);

    /**
     * Determine the camera viewpoint from parallelism, corner angles and apparent aspect ratio
     * @param quad Quadrilateral points ordered TL, TR, BR, BL
     */
    static QuadOrientation orientation(const std::vector<cv::Point2f>& quad);

    static std::string orientationToString(QuadOrientation orientation);

    /**
     * Whether the table's long cushions run along the top and bottom edges of the quad.
     * A camera behind a short cushion sees the long cushions receding from it.
     */
    static bool longSideHorizontal(const std::vector<cv::Point2f>& quad);

    /**
     * Average of top and bottom edge lengths divided by the average of left and right.
     */
    static double getApparentAspectRatio(const std::vector<cv::Point2f>& quad);

    static double area(const std::vector<cv::Point2f>& quad);

    /**
     * Sanity checks for a table outline before a homography is fitted to it
     * @param quad Quadrilateral points ordered TL, TR, BR, BL
     * @param imageSize Frame size; an empty size skips the area and bounds checks
     * @param minAreaFraction Minimum quad area relative to the frame area
     */
    static QuadValidation validateTableQuad(const std::vector<cv::Point2f>& quad,
                                            cv::Size imageSize, double minAreaFraction);

   private:
    static bool areLinesParallel(const cv::Point2f& p1, const cv::Point2f& p2,
                                 const cv::Point2f& p3, const cv::Point2f& p4, double epsilon);

    // Interior angle in degrees at corner b between edges b->a and b->c.
    static double cornerAngle(const cv::Point2f& a, const cv::Point2f& b, const cv::Point2f& c);
};

#endif  // QUAD_ANALYSIS_HPP
