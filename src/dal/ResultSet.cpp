#include "dal/ResultSet.hpp"

#include "common/Errors.hpp"

#include <stdexcept>
#include <utility>

namespace sgw::dal {

namespace {

// Text the engine puts in every slot of a transaction that failed elsewhere.
const std::string kCascadeMarker = "not executed due to a failed transaction";

}  // namespace

std::string StatementResult::errorMessage() const {
  if (isOk()) return {};
  if (jResult.is_string()) return jResult.get<std::string>();
  return jResult.dump();
}

ResultSet::ResultSet(std::vector<StatementResult> vSlots) : _vSlots(std::move(vSlots)) {}

ResultSet ResultSet::fromJson(const nlohmann::json& jReply) {
  if (!jReply.is_array()) {
    throw common::ExecutionError("Unexpected query reply: expected an array of results, got " +
                                 std::string(jReply.type_name()));
  }

  std::vector<StatementResult> vSlots;
  vSlots.reserve(jReply.size());
  for (const auto& jSlot : jReply) {
    if (!jSlot.is_object() || !jSlot.contains("status") || !jSlot["status"].is_string()) {
      throw common::ExecutionError("Unexpected query reply: result slot without a status");
    }

    StatementResult sr;
    sr.sStatus = jSlot["status"].get<std::string>();
    if (jSlot.contains("time") && jSlot["time"].is_string()) {
      sr.sTime = jSlot["time"].get<std::string>();
    }
    if (jSlot.contains("result")) {
      sr.jResult = jSlot["result"];
    } else if (jSlot.contains("detail")) {
      sr.jResult = jSlot["detail"];
    }
    vSlots.push_back(std::move(sr));
  }
  return ResultSet(std::move(vSlots));
}

const StatementResult& ResultSet::at(std::size_t uSlot) const { return _vSlots.at(uSlot); }

bool ResultSet::ok() const {
  for (const auto& sr : _vSlots) {
    if (!sr.isOk()) return false;
  }
  return true;
}

void ResultSet::check() const {
  int iFirstError = -1;
  for (std::size_t i = 0; i < _vSlots.size(); ++i) {
    if (_vSlots[i].isOk()) continue;
    if (iFirstError < 0) iFirstError = static_cast<int>(i);

    const std::string sMsg = _vSlots[i].errorMessage();
    if (sMsg.find(kCascadeMarker) == std::string::npos) {
      throw common::ExecutionError("Statement " + std::to_string(i) + " failed: " + sMsg,
                                   static_cast<int>(i), sMsg);
    }
  }

  if (iFirstError >= 0) {
    const std::string sMsg = _vSlots[static_cast<std::size_t>(iFirstError)].errorMessage();
    throw common::ExecutionError("Statement " + std::to_string(iFirstError) + " failed: " + sMsg,
                                 iFirstError, sMsg);
  }
}

}  // namespace sgw::dal
