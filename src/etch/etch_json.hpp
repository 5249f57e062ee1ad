#pragma once

#include <string>
#include <vector>

#include "etch/commit_reveal.hpp"
#include "nlohmann/json.hpp"
#include "runes/runestone.hpp"

namespace runeforge::etch {

// Big integers travel as decimal strings; plain JSON unsigned numbers are
// also accepted on input.
bool EtchingFromJson(const nlohmann::json& json, runes::EtchingSpec* spec, std::string* error);
nlohmann::json EtchingToJson(const runes::EtchingSpec& spec);

// [{"tag": "4", "name": "rune", "value": "..."}, ...] in payload order.
nlohmann::json FieldsToJson(const std::vector<runes::TaggedField>& fields);
nlohmann::json RevealResultToJson(const RevealResult& result);

}  // namespace runeforge::etch
