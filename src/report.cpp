#include "tether/report.h"

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <string>

namespace tether {

const char* const FAILED_TO_SET_HINT =
    "Hint: Git doesn't allow a branch name that looks like a parent directory of\n"
    "another (e.g. `foo` and `foo/bar`). Try to rename the branches that failed to\n"
    "export or their \"parent\" branches.\n";

namespace {

// Rendered for a cause that carries no message.
constexpr const char* UNKNOWN_CAUSE = "unknown error";

} // anonymous namespace

void print_git_import_stats(Ui& ui, const GitImportStats& stats) {
    if (stats.abandoned_commits.empty()) return;
    ui.write_stderr(fmt::format("Abandoned {} commits that are no longer reachable.\n",
                                stats.abandoned_commits.size()));
}

std::string format_cause_chain(const FailedRefExportReason& reason) {
    std::string out = ": ";
    out += reason.message();

    std::exception_ptr cause = reason.source;
    while (cause) {
        try {
            std::rethrow_exception(cause);
        } catch (const std::exception& e) {
            out += ": ";
            out += e.what();
            auto nested = dynamic_cast<const std::nested_exception*>(&e);
            cause = nested ? nested->nested_ptr() : nullptr;
        } catch (const std::nested_exception& nested) {
            // A foreign error wrapped by std::throw_with_nested.
            out += ": ";
            out += UNKNOWN_CAUSE;
            cause = nested.nested_ptr();
        } catch (...) {
            out += ": ";
            out += UNKNOWN_CAUSE;
            cause = nullptr;
        }
    }
    return out;
}

void print_failed_git_export(Ui& ui, const std::vector<FailedRefExport>& failed) {
    if (failed.empty()) return;

    ui.write_labeled("warning", "Failed to export some branches:\n");
    for (const auto& f : failed) {
        std::string chain = format_cause_chain(f.reason) + "\n";
        ui.write_stderr("  ");
        ui.write_labeled("branch", f.name);
        ui.write_stderr(chain);
    }

    bool any_failed_to_set = std::any_of(
        failed.begin(), failed.end(), [](const FailedRefExport& f) {
            return f.reason.kind == FailedRefExportReason::Kind::FailedToSet;
        });
    if (any_failed_to_set) {
        ui.write_labeled("hint", FAILED_TO_SET_HINT);
    }
}

} // namespace tether
