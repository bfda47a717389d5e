#include "utils/json_formatter.hpp"

#include <gtest/gtest.h>

using nlohmann::json;

TEST(JsonFormatterTest, FeedbackRatingMapsToNull) {
  recommendation::RecommendationFeedback feedback;
  feedback.recommendation_id = "rec-1";
  feedback.user_id = "user-1";
  feedback.feedback_type = recommendation::FeedbackType::ROLLBACK;

  json j = feedback;
  EXPECT_TRUE(j.at("rating").is_null());
  EXPECT_EQ(j.at("feedback_type"), "rollback");

  j["rating"] = 4;
  auto parsed = j.get<recommendation::RecommendationFeedback>();
  ASSERT_TRUE(parsed.rating.has_value());
  EXPECT_EQ(*parsed.rating, 4);
  EXPECT_EQ(parsed.feedback_type, recommendation::FeedbackType::ROLLBACK);

  json minimal = {{"recommendation_id", "rec-2"},
                  {"user_id", "user-2"},
                  {"feedback_type", "approval"}};
  auto sparse = minimal.get<recommendation::RecommendationFeedback>();
  EXPECT_FALSE(sparse.rating.has_value());
  EXPECT_EQ(sparse.comment, "");
  EXPECT_EQ(sparse.timestamp_ms, 0u);
}

TEST(JsonFormatterTest, EnumsUseLowercaseLabels) {
  EXPECT_EQ(json(recommendation::ApprovalStatus::ROLLED_BACK), "rolled_back");
  EXPECT_EQ(json(recommendation::ApprovalStatus::PENDING), "pending");
  EXPECT_EQ(json(Granularity::HOURLY), "1h");
  EXPECT_EQ(json("15m").get<Granularity>(), Granularity::FIFTEEN_MINUTES);
}

TEST(JsonFormatterTest, RecommendationCarriesStatusLabel) {
  recommendation::Recommendation rec;
  rec.id = "rec-9";
  rec.category = "energy";
  rec.approval_status = recommendation::ApprovalStatus::IMPLEMENTED;
  rec.affected_subjects = {"meter"};

  json j = rec;
  EXPECT_EQ(j.at("approval_status"), "implemented");
  auto back = j.get<recommendation::Recommendation>();
  EXPECT_EQ(back.approval_status, recommendation::ApprovalStatus::IMPLEMENTED);
  EXPECT_EQ(back.affected_subjects, std::vector<std::string>{"meter"});
}

TEST(JsonFormatterTest, CacheStringIsCompactAndToleratesBadUtf8) {
  json j = {{"label", "ok"}, {"value", 1}};
  EXPECT_EQ(JsonFormatter::to_cache_string(j), "{\"label\":\"ok\",\"value\":1}");
  EXPECT_NE(JsonFormatter::to_display_string(j).find('\n'), std::string::npos);

  json broken = {{"label", std::string("bad\xff")}};
  std::string out;
  EXPECT_NO_THROW(out = JsonFormatter::to_cache_string(broken));
  EXPECT_NE(out.find("bad\xEF\xBF\xBD"), std::string::npos);
}
