#pragma once

#include <filesystem>
#include <string>

namespace diffgate {

// One JSON line per decision; a write failure is logged, never fatal.
void append_audit_record(const std::filesystem::path& audit_log,
                         const std::string& action,
                         const std::string& path,
                         const std::string& status,
                         const std::string& details = {});

} // namespace diffgate
