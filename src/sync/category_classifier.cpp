#include "pkbsync/sync/category_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace pkbsync::sync {

namespace {
  // Category used for the (degenerate) empty path
  constexpr std::string_view kUnknownCategory = "misc";

  std::string fileStem(std::string_view path) {
    return std::filesystem::path(std::string(path)).stem().string();
  }

  std::string removeExtension(std::string_view path) {
    std::filesystem::path p{std::string(path)};
    if (!p.has_extension()) {
      return std::string(path);
    }
    return (p.parent_path() / p.stem()).generic_string();
  }

  // Render the first run of eight digits as YYYY-MM-DD
  std::string formatDate(std::string stem) {
    constexpr std::string_view kDailySuffix = "-daily";
    if (stem.size() >= kDailySuffix.size() && stem.ends_with(kDailySuffix)) {
      stem.erase(stem.size() - kDailySuffix.size());
    }

    size_t run = 0;
    for (size_t i = 0; i < stem.size(); ++i) {
      if (std::isdigit(static_cast<unsigned char>(stem[i]))) {
        if (++run == 8) {
          size_t start = i - 7;
          return stem.substr(0, start) + stem.substr(start, 4) + "-" + stem.substr(start + 4, 2) +
                 "-" + stem.substr(start + 6, 2) + stem.substr(i + 1);
        }
      } else {
        run = 0;
      }
    }
    return stem;
  }

  std::string deriveDetail(const CategoryRule& rule, std::string_view path) {
    std::string_view rest = path.substr(rule.prefix.size());
    std::string detail;

    switch (rule.detail) {
      case DetailKind::kNone:
        return "";
      case DetailKind::kStem:
        detail = fileStem(path);
        break;
      case DetailKind::kRelativeStem:
        detail = removeExtension(rest);
        break;
      case DetailKind::kFirstSegment:
        detail = std::string(rest.substr(0, rest.find('/')));
        break;
      case DetailKind::kDate:
        detail = formatDate(fileStem(path));
        break;
    }

    return rule.detail_prefix + detail;
  }
}

std::string Category::label() const {
  if (detail.empty()) {
    return name;
  }
  return name + ": " + detail;
}

std::string detailKindToString(DetailKind kind) {
  switch (kind) {
    case DetailKind::kNone: return "none";
    case DetailKind::kStem: return "stem";
    case DetailKind::kRelativeStem: return "relative_stem";
    case DetailKind::kFirstSegment: return "first_segment";
    case DetailKind::kDate: return "date";
  }
  return "stem";
}

Result<DetailKind> stringToDetailKind(const std::string& str) {
  if (str == "none") return DetailKind::kNone;
  if (str == "stem") return DetailKind::kStem;
  if (str == "relative_stem") return DetailKind::kRelativeStem;
  if (str == "first_segment") return DetailKind::kFirstSegment;
  if (str == "date") return DetailKind::kDate;
  return std::unexpected(makeError(ErrorCode::kValidationError,
                                   "Unknown category detail kind: " + str));
}

std::string normalizePath(std::string_view path) {
  std::string result(path);
  std::replace(result.begin(), result.end(), '\\', '/');

  while (result.starts_with("./")) {
    result.erase(0, 2);
  }
  while (result.starts_with("/")) {
    result.erase(0, 1);
  }
  return result;
}

CategoryClassifier::CategoryClassifier(std::vector<CategoryRule> rules)
  : rules_(std::move(rules)) {}

Result<CategoryClassifier> CategoryClassifier::create(std::vector<CategoryRule> rules) {
  for (size_t i = 0; i < rules.size(); ++i) {
    if (rules[i].prefix.empty()) {
      return std::unexpected(makeError(ErrorCode::kValidationError,
                                       "Category rule " + std::to_string(i) + " has an empty prefix"));
    }
    if (rules[i].name.empty()) {
      return std::unexpected(makeError(ErrorCode::kValidationError,
                                       "Category rule '" + rules[i].prefix + "' has an empty name"));
    }

    // A later rule whose prefix extends an earlier one could never match
    for (size_t j = 0; j < i; ++j) {
      if (rules[i].prefix.starts_with(rules[j].prefix)) {
        return std::unexpected(makeError(ErrorCode::kValidationError,
                                         "Category rule '" + rules[i].prefix +
                                         "' is shadowed by earlier rule '" + rules[j].prefix +
                                         "'; order rules most-specific-first"));
      }
    }
  }

  return CategoryClassifier(std::move(rules));
}

std::vector<CategoryRule> CategoryClassifier::defaultRules() {
  return {
    {"knowledge/tech/", "knowledge", DetailKind::kStem, "tech/"},
    {"knowledge/", "knowledge", DetailKind::kRelativeStem, ""},
    {"aops/tasks/", "task", DetailKind::kStem, ""},
    {"daily/", "daily", DetailKind::kDate, ""},
    {"projects/", "project", DetailKind::kFirstSegment, ""},
    {"context/", "context", DetailKind::kStem, ""},
    {"goals/", "goal", DetailKind::kStem, ""},
    {"academic/", "academic", DetailKind::kStem, ""},
    {"archive/", "archive", DetailKind::kNone, ""},
  };
}

CategoryClassifier CategoryClassifier::withDefaultRules() {
  return CategoryClassifier(defaultRules());
}

Category CategoryClassifier::classify(std::string_view path) const {
  std::string normalized = normalizePath(path);

  for (const auto& rule : rules_) {
    if (normalized.starts_with(rule.prefix)) {
      return Category{rule.name, deriveDetail(rule, normalized)};
    }
  }

  // Fallback: first path segment with the file stem, or the file name itself at top level
  auto slash = normalized.find('/');
  std::string first = normalized.substr(0, slash);
  if (first.empty()) {
    return Category{std::string(kUnknownCategory), ""};
  }
  if (slash == std::string::npos) {
    return Category{first, ""};
  }
  return Category{first, fileStem(normalized)};
}

}  // namespace pkbsync::sync
