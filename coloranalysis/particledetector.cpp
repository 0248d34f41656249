#include "particledetector.h"
#include "measurelog.h"

#include <QtMath>
#include <algorithm>
#include <cmath>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace {

// QImage → cv::Mat (RGB, 8 бит на канал), данные копируются
cv::Mat toRgbMat(const QImage& image)
{
    QImage rgb = image.convertToFormat(QImage::Format_RGB888);
    return cv::Mat(rgb.height(), rgb.width(), CV_8UC3, rgb.bits(),
                   static_cast<size_t>(rgb.bytesPerLine())).clone();
}

QImage toQImage(const cv::Mat& rgb)
{
    return QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step),
                  QImage::Format_RGB888).convertToFormat(QImage::Format_RGB32);
}

// Пиксели в допуске вокруг center. H круговой: при выходе за 0..180
// добавляется второй диапазон с другой стороны круга
cv::Mat hsvMask(const cv::Mat& hsv, const HsvColor& center, const HsvTolerance& tol)
{
    const double sLo = std::max(0.0,   std::ceil(center.s - tol.s));
    const double sHi = std::min(255.0, std::floor(center.s + tol.s));
    const double vLo = std::max(0.0,   std::ceil(center.v - tol.v));
    const double vHi = std::min(255.0, std::floor(center.v + tol.v));

    cv::Mat mask;
    if (tol.h >= 90) {
        cv::inRange(hsv, cv::Scalar(0, sLo, vLo), cv::Scalar(180, sHi, vHi), mask);
        return mask;
    }

    const double hLo = std::ceil(center.h - tol.h);
    const double hHi = std::floor(center.h + tol.h);
    cv::inRange(hsv, cv::Scalar(std::max(0.0, hLo), sLo, vLo),
                cv::Scalar(std::min(180.0, hHi), sHi, vHi), mask);

    cv::Mat wrap;
    if (hLo <= 0.0) {
        cv::inRange(hsv, cv::Scalar(hLo + 180.0, sLo, vLo), cv::Scalar(180, sHi, vHi), wrap);
        cv::bitwise_or(mask, wrap, mask);
    }
    if (hHi >= 180.0) {
        cv::inRange(hsv, cv::Scalar(0, sLo, vLo), cv::Scalar(hHi - 180.0, sHi, vHi), wrap);
        cv::bitwise_or(mask, wrap, mask);
    }
    return mask;
}

struct Component {
    int     label = 0;
    int     area  = 0;
    QPointF centroid;
};

}

// ─────────────────────────────────────────────────────
// Цвет
// ─────────────────────────────────────────────────────
HsvColor ParticleDetector::toHsv(QRgb rgb)
{
    const cv::Mat px(1, 1, CV_8UC3, cv::Scalar(qRed(rgb), qGreen(rgb), qBlue(rgb)));
    cv::Mat hsv;
    cv::cvtColor(px, hsv, cv::COLOR_RGB2HSV);
    const cv::Vec3b v = hsv.at<cv::Vec3b>(0, 0);

    HsvColor out;
    out.h = v[0];
    out.s = v[1];
    out.v = v[2];
    return out;
}

HsvColor ParticleDetector::centerColor(const QVector<QRgb>& colors)
{
    HsvColor c;
    if (colors.isEmpty())
        return c;

    double sinSum = 0.0, cosSum = 0.0;
    for (QRgb rgb : colors) {
        const HsvColor hsv = toHsv(rgb);
        const double rad = hsv.h * M_PI / 90.0;        // 0-180 → 0-2π
        sinSum += std::sin(rad);
        cosSum += std::cos(rad);
        c.s += hsv.s;
        c.v += hsv.v;
    }

    const int n = colors.size();
    c.h = std::fmod(std::atan2(sinSum / n, cosSum / n) * 90.0 / M_PI + 180.0, 180.0);
    c.s /= n;
    c.v /= n;
    return c;
}

double ParticleDetector::hueDistance(double h1, double h2)
{
    const double d = std::abs(h1 - h2);
    return std::min(d, 180.0 - d);
}

HsvTolerance ParticleDetector::initialTolerance(const QVector<QRgb>& colors)
{
    HsvTolerance tol;
    if (colors.size() < 2)
        return tol;

    const HsvColor c = centerColor(colors);
    double dh = 0.0, ds = 0.0, dv = 0.0;
    for (QRgb rgb : colors) {
        const HsvColor hsv = toHsv(rgb);
        dh = std::max(dh, hueDistance(hsv.h, c.h));
        ds = std::max(ds, std::abs(hsv.s - c.s));
        dv = std::max(dv, std::abs(hsv.v - c.v));
    }

    tol.h = static_cast<int>(qBound(5.0,  dh * 1.5 + 5.0,  90.0));
    tol.s = static_cast<int>(qBound(10.0, ds * 1.5 + 10.0, 128.0));
    tol.v = static_cast<int>(qBound(10.0, dv * 1.5 + 10.0, 128.0));
    return tol;
}

// ─────────────────────────────────────────────────────
// Поиск частиц
// ─────────────────────────────────────────────────────
MeasureError ParticleDetector::detect(const QImage& image, const QVector<QRgb>& colors,
                                      const HsvTolerance& tolerance, int minArea,
                                      ParticleDetection* out, const QVector<bool>& cutMask)
{
    if (image.isNull() || colors.isEmpty())
        return MeasureError::InsufficientData;

    const cv::Mat rgb = toRgbMat(image);
    const int w = rgb.cols;
    const int h = rgb.rows;

    cv::Mat hsv;
    cv::cvtColor(rgb, hsv, cv::COLOR_RGB2HSV);
    cv::Mat mask = hsvMask(hsv, centerColor(colors), tolerance);

    // Ручные разрезы
    if (cutMask.size() == w * h) {
        cv::Mat cut(h, w, CV_8UC1, cv::Scalar(0));
        for (int y = 0; y < h; ++y) {
            uchar* row = cut.ptr<uchar>(y);
            for (int x = 0; x < w; ++x)
                row[x] = cutMask[y * w + x] ? 255 : 0;
        }
        mask.setTo(0, cut);
    }

    cv::Mat labels, stats, centroids;
    const int n = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 4, CV_32S);

    // отсечение мелких и сортировка по площади (метка 0: фон)
    std::vector<Component> kept;
    for (int i = 1; i < n; ++i) {
        const int area = stats.at<int>(i, cv::CC_STAT_AREA);
        if (area < minArea)
            continue;
        Component c;
        c.label = i;
        c.area = area;
        c.centroid = QPointF(centroids.at<double>(i, 0), centroids.at<double>(i, 1));
        kept.push_back(c);
    }
    std::stable_sort(kept.begin(), kept.end(),
                     [](const Component& a, const Component& b) { return a.area > b.area; });

    std::vector<int> remap(std::max(n, 1), 0);
    for (size_t i = 0; i < kept.size(); ++i)
        remap[kept[i].label] = static_cast<int>(i) + 1;

    ParticleDetection d;
    d.width  = w;
    d.height = h;
    d.labels.resize(w * h);
    for (int y = 0; y < h; ++y) {
        const int* row = labels.ptr<int>(y);
        for (int x = 0; x < w; ++x)
            d.labels[y * w + x] = remap[row[x]];
    }

    for (const auto& c : kept) {
        d.areasPx.push_back(c.area);
        d.centroids.push_back(c.centroid);
        d.totalAreaPx += c.area;
    }
    d.coveragePercent = (w * h) > 0 ? 100.0 * d.totalAreaPx / (double(w) * h) : 0.0;

    qCInfo(lcDetect) << "detected" << d.count() << "particles of" << (n - 1)
                     << "components, coverage" << d.coveragePercent << "%";

    if (out) *out = d;
    return MeasureError::None;
}

QVector<double> ParticleDetector::physicalAreas(const ParticleDetection& detection, double pixelSize)
{
    QVector<double> out;
    out.reserve(detection.count());
    for (int a : detection.areasPx)
        out.push_back(a * pixelSize * pixelSize);
    return out;
}

QImage ParticleDetector::overlay(const QImage& image, const ParticleDetection& detection, int alpha)
{
    static const cv::Vec3b kPalette[] = {
        {230, 25, 75},  {60, 180, 75},  {255, 225, 25}, {0, 130, 200},
        {245, 130, 48}, {145, 30, 180}, {70, 240, 240}, {240, 50, 230},
        {210, 245, 60}, {250, 190, 212}, {0, 128, 128}, {170, 110, 40}
    };
    constexpr int kPaletteSize = sizeof(kPalette) / sizeof(kPalette[0]);

    if (image.isNull())
        return QImage();

    const cv::Mat src = toRgbMat(image);
    if (src.cols != detection.width || src.rows != detection.height)
        return toQImage(src);

    cv::Mat painted = src.clone();
    for (int y = 0; y < painted.rows; ++y) {
        cv::Vec3b* row = painted.ptr<cv::Vec3b>(y);
        for (int x = 0; x < painted.cols; ++x) {
            const int label = detection.labels[y * painted.cols + x];
            if (label != 0)
                row[x] = kPalette[(label - 1) % kPaletteSize];
        }
    }

    const double a = qBound(0, alpha, 255) / 255.0;
    cv::Mat blended;
    cv::addWeighted(src, 1.0 - a, painted, a, 0.0, blended);
    return toQImage(blended);
}
