#include "core/assignment/driver_scorer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace dispatch {
namespace core {

namespace {

constexpr double kBaselineScore = 100.0;

double Blend(double running, double sub_score, double weight) {
    return running * (1.0 - weight) + sub_score * weight;
}

bool IsNumericId(const std::string& id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isdigit(c); });
}

// 纯数字ID排在前面并按数值比较, 其余按字典序
bool DriverIdLess(const std::string& a, const std::string& b) {
    const bool a_numeric = IsNumericId(a);
    const bool b_numeric = IsNumericId(b);
    if (a_numeric != b_numeric) {
        return a_numeric;
    }
    if (a_numeric && a.size() != b.size()) {
        return a.size() < b.size();
    }
    return a < b;
}

} // namespace

DriverScorer::DriverScorer(const dispatch::common::AssignmentConfig& config)
    : max_radius_km_(config.max_radius_km), default_rating_(config.default_rating) {}

std::optional<ScoredCandidate> DriverScorer::Score(const DriverCandidate& candidate,
                                                   const dispatch::geo::GeoPoint& request_location) const {
    if (!candidate.online || !candidate.available || !candidate.verified || !candidate.location) {
        return std::nullopt;
    }
    const double distance = dispatch::geo::DistanceKm(*candidate.location, request_location);
    if (distance > max_radius_km_) {
        return std::nullopt;
    }

    double score = kBaselineScore;
    score = Blend(score, std::max(0.0, 100.0 - distance * 10.0), 0.6);

    double rating = candidate.rating.value_or(default_rating_);
    if (rating <= 0.0) {
        rating = default_rating_;
    }
    score = Blend(score, rating / 5.0 * 100.0, 0.3);

    score = Blend(score, std::min(candidate.completed_jobs, 100), 0.1);

    if (candidate.average_completion_minutes && *candidate.average_completion_minutes > 0.0) {
        const double speed = std::max(0.0, 100.0 - (*candidate.average_completion_minutes - 20.0) * 2.0);
        score = Blend(score, speed, 0.05);
    }

    ScoredCandidate scored;
    scored.driver_id = candidate.driver_id;
    scored.raw_score = score;
    scored.score = static_cast<int>(std::lround(score));
    scored.distance_km = distance;
    return scored;
}

std::vector<ScoredCandidate> DriverScorer::Rank(const std::vector<DriverCandidate>& candidates,
                                                const dispatch::geo::GeoPoint& request_location) const {
    std::vector<ScoredCandidate> ranked;
    ranked.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        auto scored = Score(candidate, request_location);
        if (scored) {
            ranked.push_back(std::move(*scored));
        }
    }
    std::sort(ranked.begin(), ranked.end(), &DriverScorer::Better);
    return ranked;
}

bool DriverScorer::Better(const ScoredCandidate& a, const ScoredCandidate& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    if (a.distance_km != b.distance_km) {
        return a.distance_km < b.distance_km;
    }
    return DriverIdLess(a.driver_id, b.driver_id);
}

}
}
