#ifndef ENVELOPE_HPP
#define ENVELOPE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "types.hpp"

// Fixed response shape for every tool invocation:
//   {"status": "success", "payload": ...}
//   {"status": "error", "error": {"kind": "...", "message": "..."}}
nlohmann::json MakeSuccessEnvelope(const nlohmann::json& payload);
nlohmann::json MakeErrorEnvelope(const std::string& kind, const std::string& message);

bool IsSuccessEnvelope(const nlohmann::json& envelope);

nlohmann::json ToJson(const BucketDescriptor& bucket);
nlohmann::json ToJson(const ObjectDescriptor& object);
nlohmann::json ToJson(const TransferTask& task);

#endif // ENVELOPE_HPP
