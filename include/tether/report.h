#pragma once

/// @file report.h
/// User-facing summaries of import/export outcomes.

#include "types.h"
#include "ui.h"

#include <string>
#include <vector>

namespace tether {

/// Fixed hint shown when a ref could not be set because git forbids a
/// name that is a path prefix of another.
extern const char* const FAILED_TO_SET_HINT;

/// Report how many commits the import abandoned.  Writes nothing when none
/// were.
///
/// @throws IoError if the Ui cannot be written to.
void print_git_import_stats(Ui& ui, const GitImportStats& stats);

/// Report refs that could not be exported, one line each with the full
/// cause chain, followed by a hint when any ref failed to be set.
/// Writes nothing for an empty list.
///
/// @throws IoError if the Ui cannot be written to.
void print_failed_git_export(Ui& ui, const std::vector<FailedRefExport>& failed);

/// Render ": <reason>: <cause>: <root cause>" for one failure.
/// Causes not derived from std::exception render as "unknown error".
std::string format_cause_chain(const FailedRefExportReason& reason);

} // namespace tether
