#include "classifier.hpp"
#include "executors/result_record.hpp"

using json = nlohmann::json;

static const char* kUnguardedDivision =
    "ZeroDivisionError at runtime - division by zero not guarded";

const char* category_key(BugCategory category) {
    switch (category) {
        case BugCategory::WrongAttribute: return "wrong_attribute";
        case BugCategory::WrongInputType: return "wrong_input_type";
        case BugCategory::NameError: return "name_error";
        case BugCategory::MissingCornerCase: return "missing_corner_case";
        case BugCategory::OtherError: return "other_error";
    }
    return "other_error";
}

Classification::Classification() {
    for (auto c : kAllBugCategories) categories[c] = CategoryFinding{};
}

bool Classification::any_found() const {
    for (const auto& [category, finding] : categories) {
        if (finding.found) return true;
    }
    return false;
}

json Classification::to_json() const {
    json j;
    j["execution_success"] = execution_success;
    j["backend"] = backend;
    if (skip_reason) j["error_message"] = *skip_reason;
    for (const auto& [category, finding] : categories) {
        json f = {{"found", finding.found}};
        if (finding.found) {
            f["error"] = finding.error;
            if (!finding.traceback.empty()) f["traceback"] = finding.traceback;
            if (!finding.description.empty()) f["description"] = finding.description;
            if (!finding.error_type.empty()) f["error_type"] = finding.error_type;
        }
        j[category_key(category)] = std::move(f);
    }
    return j;
}

Classification classify(const RawExecutionResult& result) {
    Classification c;
    c.execution_success = result.success;
    if (result.success) return c;

    CategoryFinding finding;
    finding.found = true;
    finding.error = result.error.value_or("");
    finding.traceback = result.traceback.value_or("");

    switch (fault_kind_of(result)) {
        case FaultKind::ZeroDivision:
            finding.description = kUnguardedDivision;
            c.categories[BugCategory::MissingCornerCase] = finding;
            break;
        case FaultKind::Attribute:
            c.categories[BugCategory::WrongAttribute] = finding;
            break;
        case FaultKind::Type:
            c.categories[BugCategory::WrongInputType] = finding;
            break;
        case FaultKind::Name:
            c.categories[BugCategory::NameError] = finding;
            break;
        case FaultKind::None:
        case FaultKind::Other:
            finding.error_type = result.error_kind.value_or("UnknownError");
            c.categories[BugCategory::OtherError] = finding;
            break;
    }
    return c;
}

Classification skipped_classification(const std::string& reason) {
    Classification c;
    c.backend = "skipped";
    c.skip_reason = reason;
    return c;
}
