#pragma once

#include <map>
#include <string>
#include <string_view>

namespace jobstore::jobs {

// Persisted state names.
namespace states {
inline constexpr std::string_view kCreated    = "created";
inline constexpr std::string_view kEnqueued   = "enqueued";
inline constexpr std::string_view kScheduled  = "scheduled";
inline constexpr std::string_view kProcessing = "processing";
inline constexpr std::string_view kSucceeded  = "succeeded";
inline constexpr std::string_view kFailed     = "failed";
inline constexpr std::string_view kDeleted    = "deleted";
} // namespace states

inline bool IsFinalState(std::string_view state) {
  return state == states::kSucceeded || state == states::kFailed || state == states::kDeleted;
}

inline bool IsKnownState(std::string_view state) {
  return state == states::kCreated || state == states::kEnqueued || state == states::kScheduled || state == states::kProcessing ||
         IsFinalState(state);
}

// A state to move a job into, or to record in its history.
struct StateChange {
  std::string                        name;
  std::string                        reason;
  std::map<std::string, std::string> data;
};

} // namespace jobstore::jobs
