#include "json_formatter.hpp"

namespace recommendation {

void to_json(nlohmann::json &j, const RecommendationFeedback &feedback) {
  j["recommendation_id"] = feedback.recommendation_id;
  j["user_id"] = feedback.user_id;
  j["feedback_type"] = feedback.feedback_type;
  if (feedback.rating)
    j["rating"] = *feedback.rating;
  else
    j["rating"] = nullptr;
  j["comment"] = feedback.comment;
  j["timestamp_ms"] = feedback.timestamp_ms;
}

void from_json(const nlohmann::json &j, RecommendationFeedback &feedback) {
  j.at("recommendation_id").get_to(feedback.recommendation_id);
  j.at("user_id").get_to(feedback.user_id);
  j.at("feedback_type").get_to(feedback.feedback_type);

  auto rating_it = j.find("rating");
  if (rating_it != j.end() && !rating_it->is_null())
    feedback.rating = rating_it->get<int>();
  else
    feedback.rating.reset();

  feedback.comment = j.value("comment", "");
  feedback.timestamp_ms = j.value("timestamp_ms", uint64_t{0});
}

} // namespace recommendation

std::string JsonFormatter::to_cache_string(const nlohmann::json &value) {
  // Invalid UTF-8 in labels must not make a cache write throw
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string JsonFormatter::to_display_string(const nlohmann::json &value) {
  return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}
