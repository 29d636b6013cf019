#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pkbsync/common.hpp"

namespace pkbsync::sync {

/**
 * @brief Semantic label for a changed path
 *
 * Categories are a pure function of the path string, so classification is
 * deterministic and idempotent.
 */
struct Category {
  std::string name;    // e.g. "project"
  std::string detail;  // e.g. "alpha"; empty for coarse categories

  // "<name>: <detail>", or just "<name>" when there is no detail
  std::string label() const;

  bool operator==(const Category&) const = default;
};

/**
 * @brief How a rule derives the detail part of a category
 */
enum class DetailKind {
  kNone,          // no detail ("archive")
  kStem,          // file name without extension, optionally behind detail_prefix
  kRelativeStem,  // path below the rule prefix without extension ("ml/foo")
  kFirstSegment,  // first path segment below the prefix ("projects/alpha/x" -> "alpha")
  kDate           // stem without "-daily", YYYYMMDD rendered as YYYY-MM-DD
};

/**
 * @brief One ordered prefix rule
 */
struct CategoryRule {
  std::string prefix;         // matched against the normalised path, e.g. "knowledge/tech/"
  std::string name;           // category name
  DetailKind detail = DetailKind::kStem;
  std::string detail_prefix;  // prepended to the detail, e.g. "tech/"
};

std::string detailKindToString(DetailKind kind);
Result<DetailKind> stringToDetailKind(const std::string& str);

/**
 * @brief Maps changed paths to categories with an ordered rule table
 *
 * The table is evaluated first-match. It must be ordered most-specific-first:
 * create() rejects a table in which a rule is shadowed by an earlier rule
 * whose prefix is a prefix of its own. Paths matching no rule fall back to
 * their first path segment, with the file stem as detail below the top level.
 */
class CategoryClassifier {
public:
  /**
   * @brief Build a classifier over a validated rule table
   * @return Classifier, or kValidationError for empty prefixes/names or shadowed rules
   */
  static Result<CategoryClassifier> create(std::vector<CategoryRule> rules);

  /**
   * @brief Classifier with the built-in PKB rule table
   */
  static CategoryClassifier withDefaultRules();

  /**
   * @brief The built-in PKB rule table, most specific first
   */
  static std::vector<CategoryRule> defaultRules();

  /**
   * @brief Classify a repository-relative path. Total: every path maps to a category.
   */
  Category classify(std::string_view path) const;

  const std::vector<CategoryRule>& rules() const { return rules_; }

private:
  explicit CategoryClassifier(std::vector<CategoryRule> rules);

  std::vector<CategoryRule> rules_;
};

/**
 * @brief Strip "./" prefixes and convert backslashes to forward slashes
 */
std::string normalizePath(std::string_view path);

}  // namespace pkbsync::sync
