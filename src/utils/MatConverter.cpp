#include "utils/MatConverter.h"

#include <QDebug>

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace MatConverter {

cv::Mat toBgr(const QImage& image)
{
    return toBgr(image, image.width());
}

cv::Mat toBgr(const QImage& image, int width)
{
    if (image.isNull()) {
        qWarning() << "MatConverter::toBgr: received null QImage";
        return {};
    }

    const int columns = std::clamp(width, 0, image.width());
    if (columns == 0) {
        return {};
    }

    QImage rgb = image.convertToFormat(QImage::Format_RGB32);
    cv::Mat bgra(rgb.height(), rgb.width(), CV_8UC4,
                 const_cast<uchar*>(rgb.constBits()),
                 static_cast<size_t>(rgb.bytesPerLine()));

    // cvtColor allocates a new buffer, detaching from the QImage data
    cv::Mat bgr;
    cv::cvtColor(bgra.colRange(0, columns), bgr, cv::COLOR_BGRA2BGR);
    return bgr;
}

} // namespace MatConverter
