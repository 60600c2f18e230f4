#include "core/ReportGenerator.hpp"

#include <gtest/gtest.h>

using namespace ferry::common;
using ferry::core::ReportGenerator;

TEST(ReportGeneratorTest, CopiesFinishedSessionFields) {
  Session sess;
  sess.sToken = "tok";
  sess.status = SessionStatus::TransferFailed;
  sess.vSrcPaths = {"/srv/a", "/srv/b"};
  sess.sDestPath = "/home/ubuntu/in";
  sess.sClientHost = "10.0.0.5";
  sess.sClientUser = "ubuntu";
  sess.oExpectedSizeBytes = 175;
  sess.oStartedAt = 10.0;
  sess.oFinishedAt = 20.0;
  sess.oTransferRc = 2;
  sess.oCleanupRc = 0;

  auto rpt = ReportGenerator::summarize(sess);
  EXPECT_EQ(rpt.sToken, "tok");
  EXPECT_EQ(rpt.status, SessionStatus::TransferFailed);
  EXPECT_EQ(rpt.vSrcPaths, sess.vSrcPaths);
  EXPECT_EQ(rpt.sDestPath, "/home/ubuntu/in");
  EXPECT_EQ(rpt.sClientHost, "10.0.0.5");
  EXPECT_EQ(rpt.sClientUser, "ubuntu");
  EXPECT_EQ(rpt.oExpectedSizeBytes, std::optional<uint64_t>(175));
  EXPECT_EQ(rpt.oTransferRc, std::optional<int>(2));
  EXPECT_EQ(rpt.oCleanupRc, std::optional<int>(0));
}

TEST(ReportGeneratorTest, MissingValuesStayAbsent) {
  Session sess;
  sess.sToken = "tok";
  sess.status = SessionStatus::StartingTransfer;
  sess.oCleanupRc = 0;

  auto rpt = ReportGenerator::summarize(sess);
  EXPECT_FALSE(rpt.oTransferRc.has_value());
  EXPECT_FALSE(rpt.oFinishedAt.has_value());
  EXPECT_EQ(rpt.status, SessionStatus::StartingTransfer);
}
