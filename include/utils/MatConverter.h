#ifndef SCREENCATCH_MATCONVERTER_H
#define SCREENCATCH_MATCONVERTER_H

#include <QImage>

#include <opencv2/core.hpp>

// QImage → cv::Mat conversion for pixel statistics.
//
// Qt's Format_RGB32 stores pixels as 0xAARRGGBB, which on little-endian
// architectures gives byte order B-G-R-A, matching OpenCV's CV_8UC4 (BGRA).
// The alpha byte is dropped so that statistics only see color samples.

namespace MatConverter {

// Returns a deep-copy CV_8UC3 (BGR) Mat, safe to use after the QImage is destroyed.
// Returns an empty Mat for a null image.
cv::Mat toBgr(const QImage& image);

// Same as toBgr() restricted to the first `width` columns.
cv::Mat toBgr(const QImage& image, int width);

} // namespace MatConverter

#endif // SCREENCATCH_MATCONVERTER_H
