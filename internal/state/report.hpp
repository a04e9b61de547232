#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace fetchledger::state {

constexpr std::size_t kMaxIssueExamples = 5;

/*
  One row of an integrity/repair/validation report: what kind of problem,
  where, how many, and a few of the identifiers involved.
*/
struct Issue {
  std::string              type;
  std::string              detail;
  std::int64_t             count = 0;
  std::vector<std::string> examples;
};

inline Issue MakeIssue(std::string type, std::string detail, const std::vector<std::string>& items) {
  Issue issue;
  issue.type   = std::move(type);
  issue.detail = std::move(detail);
  issue.count  = static_cast<std::int64_t>(items.size());
  for (std::size_t i = 0; i < items.size() && i < kMaxIssueExamples; ++i) {
    issue.examples.push_back(items[i]);
  }
  return issue;
}

} // namespace fetchledger::state
