#pragma once
#include "executors/iexecutor.hpp"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class BugCategory {
    WrongAttribute,
    WrongInputType,
    NameError,
    MissingCornerCase,
    OtherError
};

inline constexpr std::array<BugCategory, 5> kAllBugCategories = {
    BugCategory::WrongAttribute,
    BugCategory::WrongInputType,
    BugCategory::NameError,
    BugCategory::MissingCornerCase,
    BugCategory::OtherError,
};

// Report key, e.g. "missing_corner_case".
const char* category_key(BugCategory category);

struct CategoryFinding {
    bool found{false};
    std::string error;
    std::string traceback;
    std::string description;
    std::string error_type;   // OtherError only: the original fault label
};

struct Classification {
    bool execution_success{false};
    std::string backend;                      // "container", "subprocess" or "skipped"
    std::optional<std::string> skip_reason;
    std::map<BugCategory, CategoryFinding> categories;

    Classification();

    const CategoryFinding& at(BugCategory category) const { return categories.at(category); }
    bool any_found() const;
    bool skipped() const { return skip_reason.has_value(); }

    nlohmann::json to_json() const;
};

// Fixed mapping from raw outcome to at most one category.
Classification classify(const RawExecutionResult& result);

// Every category false, with `reason` recorded as the explanation.
Classification skipped_classification(const std::string& reason);
