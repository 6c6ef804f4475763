#include "RegionMerger.h"

#include <opencv2/core/utils/logger.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace SpriteExtractor {

DisjointSet::DisjointSet(size_t n) : m_parent(n) {
    std::iota(m_parent.begin(), m_parent.end(), size_t{0});
}

size_t DisjointSet::find(size_t x) {
    size_t root = x;
    while (m_parent[root] != root) root = m_parent[root];
    while (m_parent[x] != root) {
        const size_t next = m_parent[x];
        m_parent[x] = root;
        x = next;
    }
    return root;
}

bool DisjointSet::unite(size_t a, size_t b) {
    const size_t ra = find(a);
    const size_t rb = find(b);
    if (ra == rb) return false;
    if (ra < rb) m_parent[rb] = ra;
    else m_parent[ra] = rb;
    return true;
}

MergeFilterParams MergeFilterParams::from(const ProcessingConfig& cfg) {
    MergeFilterParams p;
    p.distanceThreshold = static_cast<double>(cfg.distanceThreshold);
    p.gapMetric = cfg.gapMetric;
    p.sizeRatioThreshold = cfg.sizeRatioThreshold;
    p.minAreaRatio = cfg.minAreaRatio;
    p.maxAreaRatio = cfg.maxAreaRatio;
    p.maxAspectRatio = cfg.maxAspectRatio;
    return p;
}

double RegionMerger::boxGap(const cv::Rect& a, const cv::Rect& b, GapMetric metric) {
    if (metric == GapMetric::Centroid) {
        const double dx = (a.x + a.width * 0.5) - (b.x + b.width * 0.5);
        const double dy = (a.y + a.height * 0.5) - (b.y + b.height * 0.5);
        return std::hypot(dx, dy);
    }
    // Rect is half-open, so boxes that touch have a gap of 0.
    const int dx = std::max(0, std::max(a.x, b.x) - std::min(a.x + a.width, b.x + b.width));
    const int dy = std::max(0, std::max(a.y, b.y) - std::min(a.y + a.height, b.y + b.height));
    return std::hypot(static_cast<double>(dx), static_cast<double>(dy));
}

Region RegionMerger::combine(const std::vector<const Region*>& members) {
    if (members.size() == 1) return *members.front();

    cv::Rect box = members.front()->bbox;
    for (const Region* m : members) box |= m->bbox;

    Region out;
    out.bbox = box;
    out.pixelMask = cv::Mat::zeros(box.size(), CV_8UC1);
    out.fragments = 0;
    for (const Region* m : members) {
        out.pixelCount += m->pixelCount;
        out.fragments += m->fragments;
        if (m->pixelMask.empty()) continue;
        cv::Mat dst = out.pixelMask(cv::Rect(m->bbox.x - box.x, m->bbox.y - box.y, m->bbox.width, m->bbox.height));
        cv::bitwise_or(dst, m->pixelMask, dst);
    }
    return out;
}

std::vector<Region> RegionMerger::merge(const std::vector<Region>& regions, double distanceThreshold, GapMetric metric) {
    std::vector<Region> current = regions;
    bool mergedAny = false;

    // A merged box can come within range of a box none of its members was close to,
    // so repeat until a pass joins nothing.
    while (current.size() > 1) {
        const size_t n = current.size();
        DisjointSet sets(n);
        bool joined = false;
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                if (boxGap(current[i].bbox, current[j].bbox, metric) <= distanceThreshold) {
                    joined = sets.unite(i, j) || joined;
                }
            }
        }
        if (!joined) break;
        mergedAny = true;

        // Groups are emitted in order of their smallest member.
        std::vector<std::vector<const Region*>> groups;
        std::vector<int> groupOfRoot(n, -1);
        for (size_t i = 0; i < n; ++i) {
            const size_t root = sets.find(i);
            if (groupOfRoot[root] < 0) {
                groupOfRoot[root] = static_cast<int>(groups.size());
                groups.emplace_back();
            }
            groups[static_cast<size_t>(groupOfRoot[root])].push_back(&current[i]);
        }

        std::vector<Region> next;
        next.reserve(groups.size());
        for (const auto& g : groups) next.push_back(combine(g));
        current = std::move(next);
    }

    if (mergedAny) {
        for (size_t i = 0; i < current.size(); ++i) {
            if (current[i].fragments > 1 && current[i].groupId < 0) current[i].groupId = static_cast<int>(i);
        }
    }

    CV_LOG_DEBUG(NULL, "RegionMerger: " << regions.size() << " -> " << current.size() << " regions after merge (threshold "
                                        << distanceThreshold << "px)");
    return current;
}

std::vector<Region> RegionMerger::filterByArea(std::vector<Region> regions, cv::Size imageSize, double minAreaRatio, double maxAreaRatio) {
    const double total = static_cast<double>(imageSize.area());
    if (total <= 0.0) return {};
    regions.erase(std::remove_if(regions.begin(), regions.end(), [&](const Region& r) {
                      const double ratio = static_cast<double>(r.pixelCount) / total;
                      return ratio < minAreaRatio || ratio > maxAreaRatio;
                  }),
                  regions.end());
    return regions;
}

std::vector<Region> RegionMerger::filterByAspect(std::vector<Region> regions, double maxAspectRatio) {
    if (maxAspectRatio <= 0.0) return regions;
    regions.erase(std::remove_if(regions.begin(), regions.end(), [&](const Region& r) {
                      if (r.bbox.width <= 0 || r.bbox.height <= 0) return true;
                      const double aspect = static_cast<double>(r.bbox.width) / static_cast<double>(r.bbox.height);
                      return aspect > maxAspectRatio || (1.0 / aspect) > maxAspectRatio;
                  }),
                  regions.end());
    return regions;
}

std::vector<Region> RegionMerger::filterBySizeRatio(std::vector<Region> regions, double sizeRatioThreshold) {
    if (regions.empty()) return regions;
    long long largest = 0;
    for (const auto& r : regions) largest = std::max<long long>(largest, static_cast<long long>(r.bbox.area()));
    const double floorArea = sizeRatioThreshold * static_cast<double>(largest);
    regions.erase(std::remove_if(regions.begin(), regions.end(),
                                 [&](const Region& r) { return static_cast<double>(r.bbox.area()) < floorArea; }),
                  regions.end());
    return regions;
}

void RegionMerger::assignReadingOrder(std::vector<Region>& regions) {
    if (regions.empty()) return;

    auto centerY = [](const Region& r) { return r.bbox.y + r.bbox.height * 0.5; };

    std::vector<size_t> byY(regions.size());
    std::iota(byY.begin(), byY.end(), size_t{0});
    std::stable_sort(byY.begin(), byY.end(), [&](size_t a, size_t b) {
        const double ya = centerY(regions[a]);
        const double yb = centerY(regions[b]);
        if (ya != yb) return ya < yb;
        return regions[a].bbox.x < regions[b].bbox.x;
    });

    // A row is anchored on its topmost region; later regions whose centre falls inside
    // the anchor's vertical span belong to the same row.
    std::vector<std::vector<size_t>> rows;
    int bandTop = 0;
    int bandBottom = 0;
    for (const size_t idx : byY) {
        const double cy = centerY(regions[idx]);
        if (rows.empty() || cy < bandTop || cy >= bandBottom) {
            rows.emplace_back();
            bandTop = regions[idx].bbox.y;
            bandBottom = regions[idx].bbox.y + regions[idx].bbox.height;
        }
        rows.back().push_back(idx);
    }

    std::vector<Region> ordered;
    ordered.reserve(regions.size());
    for (auto& row : rows) {
        std::stable_sort(row.begin(), row.end(), [&](size_t a, size_t b) {
            if (regions[a].bbox.x != regions[b].bbox.x) return regions[a].bbox.x < regions[b].bbox.x;
            return regions[a].bbox.y < regions[b].bbox.y;
        });
        for (const size_t idx : row) ordered.push_back(std::move(regions[idx]));
    }
    for (size_t i = 0; i < ordered.size(); ++i) ordered[i].index = static_cast<int>(i);
    regions = std::move(ordered);
}

std::vector<Region> RegionMerger::mergeAndFilter(const std::vector<Region>& regions, cv::Size imageSize, const MergeFilterParams& params) {
    std::vector<Region> kept = merge(regions, params.distanceThreshold, params.gapMetric);
    const size_t merged = kept.size();
    kept = filterByArea(std::move(kept), imageSize, params.minAreaRatio, params.maxAreaRatio);
    const size_t afterArea = kept.size();
    kept = filterByAspect(std::move(kept), params.maxAspectRatio);
    kept = filterBySizeRatio(std::move(kept), params.sizeRatioThreshold);
    assignReadingOrder(kept);

    CV_LOG_INFO(NULL, "RegionMerger: " << regions.size() << " fragments, " << merged << " merged, " << afterArea
                                       << " within area bounds, " << kept.size() << " kept");
    return kept;
}

} // namespace SpriteExtractor
