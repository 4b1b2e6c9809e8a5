#pragma once

#include <string>

#include "internal/model/ledger.hpp"
#include "internal/model/policy.hpp"

namespace timebank::v1 {
class PolicySettings;
}

namespace timebank::db::codec {

/*
  Text encodings shared by the SQL backends.

  Policy settings round-trip through timebank.v1.PolicySettings and its
  canonical JSON form; ledger metadata is a flat JSON object of strings.
*/

timebank::v1::PolicySettings ToProto(const model::PolicySettings& settings);
model::PolicySettings        FromProto(const timebank::v1::PolicySettings& proto);

std::string           EncodeSettings(const model::PolicySettings& settings);
model::PolicySettings DecodeSettings(const std::string& json);

std::string     EncodeMetadata(const model::Metadata& metadata);
model::Metadata DecodeMetadata(const std::string& json);

} // namespace timebank::db::codec
