#include "recommendation_types.hpp"

namespace recommendation {

const char *approval_status_to_string(ApprovalStatus status) {
  switch (status) {
  case ApprovalStatus::PENDING:
    return "pending";
  case ApprovalStatus::APPROVED:
    return "approved";
  case ApprovalStatus::REJECTED:
    return "rejected";
  case ApprovalStatus::IMPLEMENTED:
    return "implemented";
  case ApprovalStatus::ROLLED_BACK:
    return "rolled_back";
  }
  return "pending";
}

std::optional<ApprovalStatus> parse_approval_status(const std::string &label) {
  if (label == "pending")
    return ApprovalStatus::PENDING;
  if (label == "approved")
    return ApprovalStatus::APPROVED;
  if (label == "rejected")
    return ApprovalStatus::REJECTED;
  if (label == "implemented")
    return ApprovalStatus::IMPLEMENTED;
  if (label == "rolled_back")
    return ApprovalStatus::ROLLED_BACK;
  return std::nullopt;
}

bool is_valid_transition(ApprovalStatus from, ApprovalStatus to) {
  switch (from) {
  case ApprovalStatus::PENDING:
    return to == ApprovalStatus::APPROVED || to == ApprovalStatus::REJECTED;
  case ApprovalStatus::APPROVED:
    return to == ApprovalStatus::IMPLEMENTED;
  case ApprovalStatus::IMPLEMENTED:
    return to == ApprovalStatus::ROLLED_BACK;
  case ApprovalStatus::REJECTED:
  case ApprovalStatus::ROLLED_BACK:
    return false;
  }
  return false;
}

const char *feedback_type_to_string(FeedbackType type) {
  switch (type) {
  case FeedbackType::APPROVAL:
    return "approval";
  case FeedbackType::REJECTION:
    return "rejection";
  case FeedbackType::IMPLEMENTATION:
    return "implementation";
  case FeedbackType::ROLLBACK:
    return "rollback";
  case FeedbackType::RATING:
    return "rating";
  }
  return "rating";
}

std::optional<FeedbackType> parse_feedback_type(const std::string &label) {
  if (label == "approval")
    return FeedbackType::APPROVAL;
  if (label == "rejection")
    return FeedbackType::REJECTION;
  if (label == "implementation")
    return FeedbackType::IMPLEMENTATION;
  if (label == "rollback")
    return FeedbackType::ROLLBACK;
  if (label == "rating")
    return FeedbackType::RATING;
  return std::nullopt;
}

} // namespace recommendation
