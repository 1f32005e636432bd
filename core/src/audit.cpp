#include "diffgate/audit.h"

#include "diffgate/paths.h"
#include "diffgate_data/serialization.h"

#include <nlohmann/json.hpp>

namespace diffgate {

void append_audit_record(const std::filesystem::path& audit_log,
                         const std::string& action,
                         const std::string& path,
                         const std::string& status,
                         const std::string& details) {
  if (audit_log.empty()) return;
  nlohmann::json record;
  record["time"] = now_iso();
  record["source"] = "diffgatectl";
  record["action"] = action;
  record["path"] = path;
  record["status"] = status;
  record["details"] = details;
  diffgate::data::append_json_line(audit_log, record);
}

} // namespace diffgate
