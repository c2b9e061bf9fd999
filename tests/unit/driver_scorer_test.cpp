#include "core/assignment/driver_scorer.hpp"

#include <gtest/gtest.h>

using dispatch::core::DriverCandidate;
using dispatch::core::DriverScorer;
using dispatch::geo::GeoPoint;

namespace {

constexpr double kKmPerDegree = 6371.0 * 3.14159265358979323846 / 180.0;

// 请求位于原点, 司机放在同一经线上, 纬度差换算成给定距离
GeoPoint PointAtKm(double km) {
    return GeoPoint::Create(km / kKmPerDegree, 0.0).Value();
}

DriverCandidate Candidate(const std::string& id, double km) {
    DriverCandidate candidate;
    candidate.driver_id = id;
    candidate.location = PointAtKm(km);
    candidate.online = true;
    candidate.available = true;
    candidate.verified = true;
    return candidate;
}

dispatch::common::AssignmentConfig Config() {
    dispatch::common::AssignmentConfig config;
    config.max_radius_km = 10.0;
    config.default_rating = 3.0;
    return config;
}

const GeoPoint kOrigin = GeoPoint::Create(0.0, 0.0).Value();

} // namespace

TEST(DriverScorerTest, BlendsSubScoresInOrder) {
    DriverScorer scorer(Config());

    auto near = Candidate("d-1", 1.0);
    near.rating = 4.5;
    near.completed_jobs = 50;
    near.average_completion_minutes = 25.0;
    auto scored = scorer.Score(near, kOrigin);
    ASSERT_TRUE(scored.has_value());
    EXPECT_NEAR(scored->raw_score, 88.594, 1e-6);
    EXPECT_EQ(scored->score, 89);
    EXPECT_NEAR(scored->distance_km, 1.0, 1e-9);

    // 经验分封顶 100, 没有完成时长时跳过速度项
    auto veteran = Candidate("d-2", 3.0);
    veteran.rating = 4.0;
    veteran.completed_jobs = 200;
    auto veteran_scored = scorer.Score(veteran, kOrigin);
    ASSERT_TRUE(veteran_scored.has_value());
    EXPECT_NEAR(veteran_scored->raw_score, 83.26, 1e-6);
    EXPECT_EQ(veteran_scored->score, 83);
}

TEST(DriverScorerTest, MissingOrZeroRatingUsesDefault) {
    DriverScorer scorer(Config());
    auto unrated = Candidate("a", 2.0);
    auto zero = Candidate("b", 2.0);
    zero.rating = 0.0;
    auto rated = Candidate("c", 2.0);
    rated.rating = 3.0;

    auto s1 = scorer.Score(unrated, kOrigin);
    auto s2 = scorer.Score(zero, kOrigin);
    auto s3 = scorer.Score(rated, kOrigin);
    ASSERT_TRUE(s1 && s2 && s3);
    EXPECT_NEAR(s1->raw_score, 71.64, 1e-6);
    EXPECT_DOUBLE_EQ(s1->raw_score, s2->raw_score);
    EXPECT_DOUBLE_EQ(s1->raw_score, s3->raw_score);
}

TEST(DriverScorerTest, IneligibleCandidatesAreExcluded) {
    DriverScorer scorer(Config());

    auto offline = Candidate("offline", 1.0);
    offline.online = false;
    auto busy = Candidate("busy", 1.0);
    busy.available = false;
    auto unverified = Candidate("unverified", 1.0);
    unverified.verified = false;
    auto unknown = Candidate("unknown", 1.0);
    unknown.location.reset();
    auto far = Candidate("far", 10.5);

    EXPECT_FALSE(scorer.Score(offline, kOrigin).has_value());
    EXPECT_FALSE(scorer.Score(busy, kOrigin).has_value());
    EXPECT_FALSE(scorer.Score(unverified, kOrigin).has_value());
    EXPECT_FALSE(scorer.Score(unknown, kOrigin).has_value());
    EXPECT_FALSE(scorer.Score(far, kOrigin).has_value());

    auto ranked = scorer.Rank({offline, busy, unverified, unknown, far}, kOrigin);
    EXPECT_TRUE(ranked.empty());
}

TEST(DriverScorerTest, RankOrdersByScoreThenDistanceThenId) {
    DriverScorer scorer(Config());

    auto best = Candidate("z", 0.5);
    best.rating = 5.0;
    best.completed_jobs = 100;
    // 与 "2" 同分, 但距离更近
    auto closer = Candidate("7", 2.0);
    auto farther = Candidate("2", 2.01);
    // 同分同距离, 数字ID按数值比较
    auto id9 = Candidate("9", 4.0);
    auto id10 = Candidate("10", 4.0);

    auto ranked = scorer.Rank({id10, farther, id9, closer, best}, kOrigin);
    ASSERT_EQ(ranked.size(), 5u);
    EXPECT_EQ(ranked[0].driver_id, "z");
    EXPECT_EQ(ranked[1].driver_id, "7");
    EXPECT_EQ(ranked[2].driver_id, "2");
    EXPECT_EQ(ranked[1].score, ranked[2].score);
    EXPECT_EQ(ranked[3].driver_id, "9");
    EXPECT_EQ(ranked[4].driver_id, "10");
}

TEST(DriverScorerTest, IdTieBreakIsTotalOrder) {
    auto tied = [](const std::string& id) {
        dispatch::core::ScoredCandidate candidate;
        candidate.driver_id = id;
        candidate.score = 50;
        candidate.raw_score = 50.0;
        candidate.distance_km = 1.0;
        return candidate;
    };
    // 纯数字ID先于其他ID, 不会出现 2 < 10 < 1a < 2 的循环
    EXPECT_TRUE(DriverScorer::Better(tied("2"), tied("10")));
    EXPECT_TRUE(DriverScorer::Better(tied("10"), tied("1a")));
    EXPECT_TRUE(DriverScorer::Better(tied("2"), tied("1a")));
    EXPECT_FALSE(DriverScorer::Better(tied("1a"), tied("2")));
    EXPECT_TRUE(DriverScorer::Better(tied("1a"), tied("b")));
    EXPECT_FALSE(DriverScorer::Better(tied("7"), tied("7")));

    DriverScorer scorer(Config());
    auto ranked = scorer.Rank({Candidate("1a", 3.0), Candidate("10", 3.0), Candidate("b", 3.0),
                               Candidate("2", 3.0)}, kOrigin);
    ASSERT_EQ(ranked.size(), 4u);
    EXPECT_EQ(ranked[0].driver_id, "2");
    EXPECT_EQ(ranked[1].driver_id, "10");
    EXPECT_EQ(ranked[2].driver_id, "1a");
    EXPECT_EQ(ranked[3].driver_id, "b");
}

TEST(DriverScorerTest, RatingGapOutweighsCloserDistance) {
    DriverScorer scorer(Config());
    auto experienced = Candidate("1", 2.0);
    experienced.rating = 4.8;
    experienced.completed_jobs = 50;
    auto nearby = Candidate("2", 1.0);
    nearby.rating = 3.0;
    nearby.completed_jobs = 5;

    auto ranked = scorer.Rank({nearby, experienced}, kOrigin);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].driver_id, "1");
    EXPECT_NEAR(ranked[0].raw_score, 86.36, 1e-6);
    EXPECT_EQ(ranked[0].score, 86);
    EXPECT_EQ(ranked[1].driver_id, "2");
    EXPECT_NEAR(ranked[1].raw_score, 75.92, 1e-6);
    EXPECT_EQ(ranked[1].score, 76);
}
