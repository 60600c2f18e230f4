#include "common/Types.hpp"

#include <chrono>
#include <stdexcept>

namespace ferry::common {

std::string toString(SessionStatus status) {
  switch (status) {
    case SessionStatus::WaitingForClient: return "waiting_for_client";
    case SessionStatus::StartingTransfer: return "starting_transfer";
    case SessionStatus::TransferSuccess: return "transfer_success";
    case SessionStatus::TransferFailed: return "transfer_failed";
  }
  throw std::invalid_argument("Unknown SessionStatus value");
}

SessionStatus statusFromString(const std::string& sValue) {
  if (sValue == "waiting_for_client") return SessionStatus::WaitingForClient;
  if (sValue == "starting_transfer") return SessionStatus::StartingTransfer;
  if (sValue == "transfer_success") return SessionStatus::TransferSuccess;
  if (sValue == "transfer_failed") return SessionStatus::TransferFailed;
  throw std::invalid_argument("Unknown session status: " + sValue);
}

bool isTerminal(SessionStatus status) {
  return status == SessionStatus::TransferSuccess || status == SessionStatus::TransferFailed;
}

double epochNow() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

}  // namespace ferry::common
