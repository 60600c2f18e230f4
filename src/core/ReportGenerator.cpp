#include "core/ReportGenerator.hpp"

namespace ferry::core {

common::Report ReportGenerator::summarize(const common::Session& sess) {
  common::Report rpt;
  rpt.sToken = sess.sToken;
  rpt.status = sess.status;
  rpt.vSrcPaths = sess.vSrcPaths;
  rpt.sDestPath = sess.sDestPath;
  rpt.sClientHost = sess.sClientHost;
  rpt.sClientUser = sess.sClientUser;
  rpt.oExpectedSizeBytes = sess.oExpectedSizeBytes;
  rpt.oStartedAt = sess.oStartedAt;
  rpt.oFinishedAt = sess.oFinishedAt;
  rpt.oTransferRc = sess.oTransferRc;
  rpt.oCleanupRc = sess.oCleanupRc;
  return rpt;
}

}  // namespace ferry::core
