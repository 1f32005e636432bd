#pragma once

#include "diffgate/apply_engine.h"
#include "diffgate/path_remap.h"
#include "diffgate/scope_guard.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace diffgate {

enum class PipelineStatus {
  NoPatch,
  Rejected,
  Applied,
  // Some sections changed; others stayed unchanged or left reject sidecars.
  Partial,
  Unchanged
};

const char* pipeline_status_name(PipelineStatus status);

struct PipelineOptions {
  ApplyEngineOptions apply;
  bool remap_missing_paths = false;
  // Empty disables audit records.
  std::filesystem::path audit_log;
};

struct PipelineResult {
  PipelineStatus status = PipelineStatus::NoPatch;
  std::string sanitized;
  PatchValidation validation;
  ApplyResult apply;
  std::vector<PathRemap> remapped;
  std::vector<std::string> unresolved;
};

// sanitize -> (remap) -> validate -> apply. Nothing touches the tree unless the
// scope guard accepts the patch.
PipelineResult run_change_pipeline(std::string_view raw,
                                   const ScopeGuard& guard,
                                   const PipelineOptions& options);

nlohmann::json pipeline_result_to_json(const PipelineResult& result, const std::string& run_id = {});

// Lists reject sidecars with a short preview of the first few.
std::string summarize_rejects(const ApplyResult& result,
                              size_t max_previews = 10,
                              size_t preview_chars = 500,
                              size_t max_names = 50);

} // namespace diffgate
