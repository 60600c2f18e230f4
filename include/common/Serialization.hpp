#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace ferry::common {

/// JSON shape of meta.json. Absent optionals are omitted.
/// bIncludeInternal controls whether private_key_path is emitted; it is
/// persisted on disk but never rendered to API clients.
nlohmann::json sessionToJson(const Session& sess, bool bIncludeInternal = true);

/// Throws nlohmann::json::exception or std::invalid_argument on malformed input.
Session sessionFromJson(const nlohmann::json& j);

/// JSON shape of report.json. Absent optionals are written as null.
nlohmann::json reportToJson(const Report& rpt);
Report reportFromJson(const nlohmann::json& j);

}  // namespace ferry::common
