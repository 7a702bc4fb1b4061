#include "inference/OpenCvDetector.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <opencv2/imgproc.hpp>

namespace inference {

namespace {

std::vector<core::NormalizedPoint> rectPoints(const cv::Rect& r, const cv::Size& frame) {
    const float w = static_cast<float>(frame.width);
    const float h = static_cast<float>(frame.height);
    const float x0 = r.x / w;
    const float y0 = r.y / h;
    const float x1 = (r.x + r.width) / w;
    const float y1 = (r.y + r.height) / h;

    // corners, then center
    return {
        {x0, y0, 0.0f}, {x1, y0, 0.0f}, {x1, y1, 0.0f}, {x0, y1, 0.0f},
        {(x0 + x1) * 0.5f, (y0 + y1) * 0.5f, 0.0f},
    };
}

std::vector<core::NormalizedPoint> contourPoints(const std::vector<cv::Point>& contour,
                                                 const cv::Size& frame, int maxPoints) {
    std::vector<core::NormalizedPoint> out;
    if (contour.empty()) return out;

    const size_t step = std::max<size_t>(1, contour.size() / static_cast<size_t>(maxPoints));
    for (size_t i = 0; i < contour.size() && out.size() < static_cast<size_t>(maxPoints); i += step) {
        out.push_back({static_cast<float>(contour[i].x) / frame.width,
                       static_cast<float>(contour[i].y) / frame.height, 0.0f});
    }
    return out;
}

} // namespace

OpenCvDetector::OpenCvDetector(const core::DetectorConfig& config) : config_(config) {
    if (config_.faceCascadePath.empty()) {
        throw DetectorError("opencv detector requires detector.face_cascade");
    }
    if (!faceCascade_.load(config_.faceCascadePath)) {
        throw DetectorError("failed to load face cascade: " + config_.faceCascadePath);
    }
    if (config_.detectPose) {
        hog_.setSVMDetector(cv::HOGDescriptor::getDefaultPeopleDetector());
    }
    core::Logger::debug("OpenCvDetector ready (cascade ", config_.faceCascadePath,
                        ", pose ", config_.detectPose ? "on" : "off", ")");
}

DetectionResult OpenCvDetector::detect(const cv::Mat& bgr) {
    if (bgr.empty() || bgr.type() != CV_8UC3) {
        throw DetectorError("expected a non-empty 8-bit BGR image");
    }

    cv::Mat work;
    const double scale = bgr.cols > WORK_WIDTH ? static_cast<double>(WORK_WIDTH) / bgr.cols : 1.0;
    if (scale < 1.0) {
        cv::resize(bgr, work, cv::Size(), scale, scale, cv::INTER_AREA);
    } else {
        work = bgr;
    }
    const cv::Size size = work.size();

    cv::Mat gray;
    cv::cvtColor(work, gray, cv::COLOR_BGR2GRAY);
    cv::equalizeHist(gray, gray);

    DetectionResult result;

    const auto faces = detectFaces(gray);
    if (!faces.empty()) {
        result.presence.face = true;
        result.landmarks.face = rectPoints(faces.front(), size);
    }

    if (config_.detectPose) {
        const auto people = detectPeople(work);
        if (!people.empty()) {
            result.presence.pose = true;
            result.landmarks.pose = rectPoints(people.front(), size);
        }
    }

    const auto hands = detectHands(work, faces);
    if (!hands.empty()) {
        result.presence.hands = true;

        // Image-left region first
        std::vector<std::pair<int, size_t>> order;
        for (size_t i = 0; i < hands.size(); ++i) {
            order.emplace_back(cv::boundingRect(hands[i]).x, i);
        }
        std::sort(order.begin(), order.end());

        result.landmarks.leftHand = contourPoints(hands[order[0].second], size, HAND_POINTS);
        if (order.size() > 1) {
            result.landmarks.rightHand = contourPoints(hands[order[1].second], size, HAND_POINTS);
        }
    }

    return result;
}

std::vector<cv::Rect> OpenCvDetector::detectFaces(const cv::Mat& gray) {
    std::vector<cv::Rect> faces;
    faceCascade_.detectMultiScale(gray, faces, 1.1, 4, 0, cv::Size(24, 24));
    std::sort(faces.begin(), faces.end(),
              [](const cv::Rect& a, const cv::Rect& b) { return a.area() > b.area(); });
    return faces;
}

std::vector<cv::Rect> OpenCvDetector::detectPeople(const cv::Mat& bgr) {
    std::vector<cv::Rect> people;
    if (bgr.cols < hog_.winSize.width || bgr.rows < hog_.winSize.height) {
        return people;
    }
    hog_.detectMultiScale(bgr, people, 0, cv::Size(8, 8), cv::Size(0, 0), 1.05);
    std::sort(people.begin(), people.end(),
              [](const cv::Rect& a, const cv::Rect& b) { return a.area() > b.area(); });
    return people;
}

std::vector<std::vector<cv::Point>> OpenCvDetector::detectHands(const cv::Mat& bgr,
                                                                const std::vector<cv::Rect>& faces) const {
    cv::Mat hsv;
    cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

    cv::Mat lowHue, highHue;
    cv::inRange(hsv, cv::Scalar(0, 20, 70), cv::Scalar(20, 255, 255), lowHue);
    cv::inRange(hsv, cv::Scalar(170, 20, 70), cv::Scalar(180, 255, 255), highHue);
    cv::Mat skin = lowHue | highHue;

    // Faces are skin too; blank them (plus neck margin) before looking for hands
    const cv::Rect bounds(0, 0, skin.cols, skin.rows);
    for (const auto& face : faces) {
        cv::Rect grown(face.x - face.width / 4, face.y - face.height / 4,
                       face.width + face.width / 2, face.height + face.height);
        skin(grown & bounds).setTo(0);
    }

    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(5, 5));
    cv::morphologyEx(skin, skin, cv::MORPH_OPEN, kernel);
    cv::morphologyEx(skin, skin, cv::MORPH_CLOSE, kernel);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(skin, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    const double frameArea = static_cast<double>(bgr.rows) * bgr.cols;
    const double minArea = config_.minHandAreaFraction * frameArea;

    std::vector<std::pair<double, size_t>> candidates;
    for (size_t i = 0; i < contours.size(); ++i) {
        if (contours[i].size() < 5) continue;

        const double area = cv::contourArea(contours[i]);
        if (area < minArea) continue;

        const cv::Rect box = cv::boundingRect(contours[i]);
        const double aspect = static_cast<double>(box.width) / std::max(1, box.height);
        if (aspect < 0.2 || aspect > 5.0) continue;

        std::vector<cv::Point> hull;
        cv::convexHull(contours[i], hull);
        const double hullArea = cv::contourArea(hull);
        const double solidity = hullArea > 0.0 ? area / hullArea : 0.0;
        const double coverage = std::min(1.0, 20.0 * area / frameArea);
        const double confidence = 0.5 * solidity + 0.5 * coverage;
        if (confidence < config_.minDetectionConfidence) continue;

        candidates.emplace_back(area, i);
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<std::vector<cv::Point>> hands;
    for (size_t i = 0; i < candidates.size() && hands.size() < 2; ++i) {
        hands.push_back(std::move(contours[candidates[i].second]));
    }
    return hands;
}

} // namespace inference
