/**
 * @file QualityFilter.cpp
 * @brief Implementation of QualityFilter.
 */

#include "application/QualityFilter.hpp"
#include <iomanip>
#include <sstream>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace chronolens::application {

namespace {

std::string Kilobytes(std::size_t bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / 1024.0) << "KB";
    return ss.str();
}

std::string Megabytes(std::size_t bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / 1024.0 / 1024.0) << "MB";
    return ss.str();
}

} // namespace

QualityFilter::QualityFilter(domain::QualityThresholds thresholds) : m_thresholds(thresholds) {}

QualityReport QualityFilter::check(const domain::ImageBytes& bytes) const {
    QualityReport report;
    report.metadata.byteSize = bytes.size();

    if (bytes.empty()) {
        report.reason = "quality check failed: empty payload";
        return report;
    }

    const auto& t = m_thresholds;
    if (bytes.size() < t.minBytes) {
        report.reason = "File too small (" + Kilobytes(bytes.size()) + ", need " + Kilobytes(t.minBytes) + ")";
        return report;
    }
    if (bytes.size() > t.maxBytes) {
        report.reason = "File too large (" + Megabytes(bytes.size()) + ", max " + Megabytes(t.maxBytes) + ")";
        return report;
    }

    // Only dimensions are read from the decoded image.
    cv::Mat image;
    try {
        image = cv::imdecode(bytes, cv::IMREAD_GRAYSCALE);
    } catch (const cv::Exception& e) {
        report.reason = std::string("quality check failed: ") + e.what();
        return report;
    }
    if (image.empty() || image.cols <= 0 || image.rows <= 0) {
        report.reason = "quality check failed: image could not be decoded";
        return report;
    }

    const int width = image.cols;
    const int height = image.rows;
    report.metadata.width = width;
    report.metadata.height = height;

    if (width < t.minWidth || height < t.minHeight) {
        std::ostringstream ss;
        ss << "Image too small (" << width << "x" << height << ", need " << t.minWidth << "x" << t.minHeight << ")";
        report.reason = ss.str();
        return report;
    }

    double aspectRatio = static_cast<double>(width) / static_cast<double>(height);
    if (aspectRatio < t.minAspectRatio || aspectRatio > t.maxAspectRatio) {
        std::ostringstream ss;
        ss << "Aspect ratio too extreme (" << std::fixed << std::setprecision(2) << aspectRatio << ")";
        report.reason = ss.str();
        return report;
    }

    std::ostringstream ss;
    ss << "Quality OK (" << width << "x" << height << ", " << Kilobytes(bytes.size()) << ")";
    report.passed = true;
    report.reason = ss.str();
    return report;
}

} // namespace chronolens::application
