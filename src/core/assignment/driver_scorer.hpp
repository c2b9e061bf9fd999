#pragma once

#include "common/config.hpp"
#include "core/assignment/assignment_types.hpp"
#include "geo/geo_math.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dispatch {
namespace core {

struct ScoredCandidate {
    std::string driver_id;
    int score = 0;          // 取整后的分数
    double raw_score = 0.0;
    double distance_km = 0.0;
};

// 司机打分: 先做硬性资格过滤, 再按距离、评分、经验、速度顺序逐步加权混合
class DriverScorer {
public:
    explicit DriverScorer(const dispatch::common::AssignmentConfig& config);

    // 不满足资格时返回空, 从不以零分参与排序
    std::optional<ScoredCandidate> Score(const DriverCandidate& candidate,
                                         const dispatch::geo::GeoPoint& request_location) const;
    // 过滤并排序, 最优者在前
    std::vector<ScoredCandidate> Rank(const std::vector<DriverCandidate>& candidates,
                                      const dispatch::geo::GeoPoint& request_location) const;

    // 分数高者优先, 同分比较原始距离, 再比较司机ID
    static bool Better(const ScoredCandidate& a, const ScoredCandidate& b);

private:
    double max_radius_km_;
    double default_rating_;
};

}
}
