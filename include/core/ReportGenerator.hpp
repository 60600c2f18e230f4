#pragma once

#include "common/Types.hpp"

namespace ferry::core {

/// Projects a finished session onto its report. No side effects.
class ReportGenerator {
 public:
  static common::Report summarize(const common::Session& sess);
};

}  // namespace ferry::core
