#include "GridPartitioner.h"
#include "Errors.h"
#include "ForegroundMask.h"

#include <opencv2/core/utils/logger.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace SpriteExtractor {

namespace {

static inline int roundDivPos(int i, int total, int parts) {
    // returns round(i * total / parts) for i>=0, parts>0
    return static_cast<int>(std::lround(static_cast<double>(i) * static_cast<double>(total) / static_cast<double>(parts)));
}

// integral01: cv::integral(binary01, integral01, CV_32S) gives (rows+1)x(cols+1).
static inline int rectSum32S(const cv::Mat& integral01, int x, int y, int w, int h) {
    if (w <= 0 || h <= 0) return 0;
    const int A = integral01.at<int>(y, x);
    const int B = integral01.at<int>(y, x + w);
    const int C = integral01.at<int>(y + h, x);
    const int D = integral01.at<int>(y + h, x + w);
    return D - B - C + A;
}

struct Cluster {
    double center = 0.0;
    int count = 0;
};

// Sorted 1D clustering; a value joins the running cluster when it is within eps of its mean.
static std::vector<Cluster> cluster1D(std::vector<double> vals, double eps) {
    std::vector<Cluster> out;
    if (vals.empty()) return out;
    std::sort(vals.begin(), vals.end());

    double sum = vals[0];
    int cnt = 1;
    for (size_t i = 1; i < vals.size(); ++i) {
        const double mean = sum / cnt;
        if (std::abs(vals[i] - mean) <= eps) {
            sum += vals[i];
            cnt++;
        } else {
            out.push_back({mean, cnt});
            sum = vals[i];
            cnt = 1;
        }
    }
    out.push_back({sum / cnt, cnt});
    return out;
}

static cv::Mat toEdgeInputGray(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
        cv::Mat alpha;
        cv::extractChannel(image, alpha, 3);
        // Transparent pixels carry arbitrary colour; treat them as a white backdrop.
        gray.setTo(255, alpha == 0);
    } else if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = image.clone();
    }
    return gray;
}

struct LineCheck {
    double err = 1.0;  // 切到的前景像素比例（0 = 每条线都落在空隙上）
    int badLines = 0;  // 找不到足够空位置的分割线数量
};

// 对 rows x cols 的每条内部分割线，在 ±radius 内找前景最少的位置。
static LineCheck checkGridLines(const cv::Mat& integral01, int W, int H, int rows, int cols, int radius) {
    constexpr double kMaxLineFill = 0.02;
    LineCheck out{};
    long long cutPixels = 0;
    long long totalCheck = 0;

    for (int r = 1; r < rows; ++r) {
        const int y = roundDivPos(r, H, rows);
        int minPix = W;
        for (int dy = -radius; dy <= radius; ++dy) {
            const int yy = y + dy;
            if (yy < 0 || yy >= H) continue;
            minPix = std::min(minPix, rectSum32S(integral01, 0, yy, W, 1));
        }
        cutPixels += minPix;
        totalCheck += W;
        if (minPix > static_cast<int>(std::lround(W * kMaxLineFill))) out.badLines++;
    }
    for (int c = 1; c < cols; ++c) {
        const int x = roundDivPos(c, W, cols);
        int minPix = H;
        for (int dx = -radius; dx <= radius; ++dx) {
            const int xx = x + dx;
            if (xx < 0 || xx >= W) continue;
            minPix = std::min(minPix, rectSum32S(integral01, xx, 0, 1, H));
        }
        cutPixels += minPix;
        totalCheck += H;
        if (minPix > static_cast<int>(std::lround(H * kMaxLineFill))) out.badLines++;
    }

    out.err = (totalCheck > 0) ? static_cast<double>(cutPixels) / static_cast<double>(totalCheck) : 1.0;
    return out;
}

static double nonEmptyCellRatio(const cv::Mat& integral01, int W, int H, int rows, int cols) {
    const int totalCells = rows * cols;
    const int totalPix = rectSum32S(integral01, 0, 0, W, H);
    const double meanPixels = static_cast<double>(totalPix) / static_cast<double>(totalCells);
    const int pixThresh = std::max(6, static_cast<int>(std::lround(meanPixels * 0.20)));

    int nonEmpty = 0;
    for (int r = 0; r < rows; ++r) {
        const int y0 = roundDivPos(r, H, rows);
        const int y1 = roundDivPos(r + 1, H, rows);
        for (int c = 0; c < cols; ++c) {
            const int x0 = roundDivPos(c, W, cols);
            const int x1 = roundDivPos(c + 1, W, cols);
            if (rectSum32S(integral01, x0, y0, x1 - x0, y1 - y0) >= pixThresh) nonEmpty++;
        }
    }
    return static_cast<double>(nonEmpty) / static_cast<double>(totalCells);
}

} // namespace

GridParams GridParams::from(const ProcessingConfig& cfg) {
    GridParams p;
    p.autoDetect = cfg.autoDetect;
    p.rows = cfg.rows;
    p.cols = cfg.cols;
    p.padding = cfg.padding;
    p.lineThreshold = cfg.lineThreshold;
    p.minLineLengthRatio = cfg.minLineLengthRatio;
    p.alphaThreshold = cfg.alphaThreshold;
    return p;
}

std::vector<GridCell> GridPartitioner::partition(const cv::Mat& image, const GridParams& params) {
    if (image.empty()) throw ConfigError("cannot partition an empty image");
    if (params.autoDetect) return detectAuto(image, params);
    return partitionFixed(image.size(), params.rows, params.cols, params.padding);
}

std::vector<GridCell> GridPartitioner::cellsFromBoundaries(const std::vector<int>& xs, const std::vector<int>& ys, int padding) {
    std::vector<GridCell> cells;
    const int rows = static_cast<int>(ys.size()) - 1;
    const int cols = static_cast<int>(xs.size()) - 1;
    cells.reserve(static_cast<size_t>(std::max(0, rows)) * static_cast<size_t>(std::max(0, cols)));

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const int x0 = xs[static_cast<size_t>(c)] + padding;
            const int x1 = xs[static_cast<size_t>(c) + 1] - padding;
            const int y0 = ys[static_cast<size_t>(r)] + padding;
            const int y1 = ys[static_cast<size_t>(r) + 1] - padding;
            if (x1 <= x0 || y1 <= y0) {
                throw ConfigError("padding " + std::to_string(padding) + " leaves cell (" + std::to_string(r) + ", " +
                                  std::to_string(c) + ") empty");
            }
            cells.push_back({cv::Rect(x0, y0, x1 - x0, y1 - y0), r, c, r * cols + c});
        }
    }
    return cells;
}

std::vector<GridCell> GridPartitioner::partitionFixed(cv::Size imageSize, int rows, int cols, int padding) {
    if (rows < 1 || cols < 1) throw ConfigError("rows and cols must be >= 1");
    if (padding < 0) throw ConfigError("padding must not be negative");
    if (imageSize.width < cols || imageSize.height < rows) {
        throw ConfigError("grid " + std::to_string(rows) + "x" + std::to_string(cols) + " is finer than the image");
    }

    std::vector<int> xs, ys;
    for (int c = 0; c <= cols; ++c) xs.push_back(roundDivPos(c, imageSize.width, cols));
    for (int r = 0; r <= rows; ++r) ys.push_back(roundDivPos(r, imageSize.height, rows));
    return cellsFromBoundaries(xs, ys, padding);
}

std::vector<int> GridPartitioner::findSeparatorLines(const cv::Mat& image, bool horizontal, int lineThreshold, double minLineLengthRatio) {
    std::vector<int> separators;
    if (image.empty()) return separators;

    const int W = image.cols;
    const int H = image.rows;
    const int span = horizontal ? W : H;   // length a separator must cover
    const int extent = horizontal ? H : W; // axis the separator positions live on

    const cv::Mat gray = toEdgeInputGray(image);
    cv::Mat edges;
    cv::Canny(gray, edges, 50, 150);

    const double minLen = minLineLengthRatio * span;
    const double maxGap = std::max(6.0, span / 50.0);
    std::vector<cv::Vec4i> lines;
    cv::HoughLinesP(edges, lines, 1.0, CV_PI / 180.0, lineThreshold, std::min(minLineLengthRatio * W, minLineLengthRatio * H), maxGap);

    // 只保留接近水平/竖直（约 2°）且足够长的线段。
    const double kMaxSlope = std::tan(2.0 * CV_PI / 180.0);
    std::vector<double> positions;
    for (const auto& l : lines) {
        const double dx = std::abs(static_cast<double>(l[2] - l[0]));
        const double dy = std::abs(static_cast<double>(l[3] - l[1]));
        if (horizontal) {
            if (dx < minLen || dy > dx * kMaxSlope) continue;
            positions.push_back(0.5 * (l[1] + l[3]));
        } else {
            if (dy < minLen || dx > dy * kMaxSlope) continue;
            positions.push_back(0.5 * (l[0] + l[2]));
        }
    }

    // A drawn line of any thickness yields an edge on each side; fold them together.
    const double eps = std::max(3.0, extent * 0.01);
    const double margin = std::max(2.0, extent * 0.02);
    for (const auto& cl : cluster1D(std::move(positions), eps)) {
        if (cl.center < margin || cl.center > extent - margin) continue; // frame, not a separator
        const int pos = static_cast<int>(std::lround(cl.center));
        if (separators.empty() || pos - separators.back() > eps) separators.push_back(pos);
    }
    return separators;
}

bool GridPartitioner::findGutterLattice(const cv::Mat& mask, int& rows, int& cols) {
    if (mask.empty() || cv::countNonZero(mask) == 0) return false;

    const int W = mask.cols;
    const int H = mask.rows;
    cv::Mat fill01 = (mask > 0) / 255;
    cv::Mat integral01;
    cv::integral(fill01, integral01, CV_32S);

    struct Candidate {
        int r = 0;
        int c = 0;
        double lineErr = 1.0;
        double nonEmptyRatio = 0.0;
    };
    std::vector<Candidate> accepted;

    const int minCellPx = 6;
    const int maxRows = std::min(64, std::max(1, H / minCellPx));
    const int maxCols = std::min(64, std::max(1, W / minCellPx));
    for (int r = 1; r <= maxRows; ++r) {
        for (int c = 1; c <= maxCols; ++c) {
            if (r == 1 && c == 1) continue;
            const int cellW = W / c;
            const int cellH = H / r;
            const int radius = std::clamp(std::min(cellW, cellH) / 10, 2, 12);
            const LineCheck lc = checkGridLines(integral01, W, H, r, c, radius);
            if (lc.badLines > 0) continue;
            const double occ = nonEmptyCellRatio(integral01, W, H, r, c);
            if (occ < 0.70) continue;
            accepted.push_back({r, c, lc.err, occ});
        }
    }
    if (accepted.empty()) return false;

    double minErr = accepted[0].lineErr;
    for (const auto& a : accepted) minErr = std::min(minErr, a.lineErr);
    const double slack = std::max(0.01, minErr * 0.50);

    // 在误差接近最小的候选里取格子最多的（避免 1x2 这类子谐波粗网格胜出）。
    const Candidate* best = nullptr;
    for (const auto& a : accepted) {
        if (a.lineErr > minErr + slack) continue;
        if (!best) { best = &a; continue; }
        const int aCells = a.r * a.c;
        const int bCells = best->r * best->c;
        if (aCells != bCells) { if (aCells > bCells) best = &a; continue; }
        if (std::abs(a.nonEmptyRatio - best->nonEmptyRatio) > 1e-6) {
            if (a.nonEmptyRatio > best->nonEmptyRatio) best = &a;
            continue;
        }
        if (a.lineErr < best->lineErr) best = &a;
    }
    rows = best->r;
    cols = best->c;
    return true;
}

std::vector<GridCell> GridPartitioner::detectAuto(const cv::Mat& image, const GridParams& params) {
    const int W = image.cols;
    const int H = image.rows;

    const std::vector<int> hLines = findSeparatorLines(image, /*horizontal=*/true, params.lineThreshold, params.minLineLengthRatio);
    const std::vector<int> vLines = findSeparatorLines(image, /*horizontal=*/false, params.lineThreshold, params.minLineLengthRatio);

    if (!hLines.empty() || !vLines.empty()) {
        std::vector<int> ys{0};
        ys.insert(ys.end(), hLines.begin(), hLines.end());
        ys.push_back(H);
        std::vector<int> xs{0};
        xs.insert(xs.end(), vLines.begin(), vLines.end());
        xs.push_back(W);
        CV_LOG_INFO(NULL, "GridPartitioner: " << hLines.size() << " horizontal / " << vLines.size()
                                              << " vertical separator lines -> " << (ys.size() - 1) << "x" << (xs.size() - 1));
        return cellsFromBoundaries(xs, ys, params.padding);
    }

    const cv::Mat mask = SpriteMask::makeForegroundMask(image, params.alphaThreshold);
    int rows = 0;
    int cols = 0;
    if (findGutterLattice(mask, rows, cols)) {
        CV_LOG_INFO(NULL, "GridPartitioner: no separator lines, gutter lattice " << rows << "x" << cols);
        return partitionFixed(image.size(), rows, cols, params.padding);
    }

    throw GridDetectionError("auto grid detection found no consistent separators; retry with explicit rows/cols");
}

std::vector<GridCell> GridPartitioner::dropEmptyCells(const std::vector<GridCell>& cells, const cv::Mat& mask) {
    std::vector<GridCell> kept;
    kept.reserve(cells.size());
    for (const auto& cell : cells) {
        if (cv::countNonZero(mask(cell.rect)) == 0) continue;
        GridCell c = cell;
        c.index = static_cast<int>(kept.size());
        kept.push_back(c);
    }
    return kept;
}

} // namespace SpriteExtractor
