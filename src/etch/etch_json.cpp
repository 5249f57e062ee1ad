#include "etch/etch_json.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace runeforge::etch {

namespace {

bool ReadBig(const nlohmann::json& value, const char* field, runes::BigUint* out,
             std::string* error) {
  if (value.is_number_unsigned()) {
    *out = value.get<std::uint64_t>();
    return true;
  }
  if (value.is_string()) {
    const auto text = value.get<std::string>();
    if (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos) {
      *out = runes::BigUint(text.c_str());
      return true;
    }
  }
  if (error) *error = std::string(field) + " must be a non-negative integer or decimal string";
  return false;
}

template <typename T>
bool ReadUnsigned(const nlohmann::json& value, const char* field, T* out, std::string* error) {
  runes::BigUint big;
  if (!ReadBig(value, field, &big, error)) {
    return false;
  }
  if (big > std::numeric_limits<T>::max()) {
    if (error) *error = std::string(field) + " is out of range";
    return false;
  }
  *out = big.template convert_to<T>();
  return true;
}

bool ReadOptionalBound(const nlohmann::json& terms, const char* field,
                       std::optional<std::uint64_t>* out, std::string* error) {
  if (!terms.contains(field) || terms.at(field).is_null()) {
    return true;
  }
  std::uint64_t value = 0;
  if (!ReadUnsigned(terms.at(field), field, &value, error)) {
    return false;
  }
  *out = value;
  return true;
}

}  // namespace

bool EtchingFromJson(const nlohmann::json& json, runes::EtchingSpec* spec, std::string* error) {
  if (!json.is_object()) {
    if (error) *error = "etching must be a JSON object";
    return false;
  }
  try {
    runes::EtchingSpec out;
    if (!json.contains("name") || !json.at("name").is_string()) {
      if (error) *error = "name is required";
      return false;
    }
    out.name = json.at("name").get<std::string>();
    if (json.contains("symbol")) {
      out.symbol = json.at("symbol").get<std::string>();
    }
    if (json.contains("divisibility")) {
      std::uint32_t divisibility = 0;
      if (!ReadUnsigned(json.at("divisibility"), "divisibility", &divisibility, error)) {
        return false;
      }
      if (divisibility > runes::kMaxDivisibility) {
        if (error) *error = "divisibility must be between 0 and 18";
        return false;
      }
      out.divisibility = static_cast<std::uint8_t>(divisibility);
    }
    if (json.contains("premine") && !ReadBig(json.at("premine"), "premine", &out.premine, error)) {
      return false;
    }
    if (json.contains("terms") && !json.at("terms").is_null()) {
      const auto& terms_json = json.at("terms");
      if (!terms_json.contains("amount") || !terms_json.contains("cap")) {
        if (error) *error = "terms require amount and cap";
        return false;
      }
      runes::MintTerms terms;
      if (!ReadBig(terms_json.at("amount"), "amount", &terms.amount, error) ||
          !ReadBig(terms_json.at("cap"), "cap", &terms.cap, error) ||
          !ReadOptionalBound(terms_json, "height_start", &terms.height_start, error) ||
          !ReadOptionalBound(terms_json, "height_end", &terms.height_end, error) ||
          !ReadOptionalBound(terms_json, "offset_start", &terms.offset_start, error) ||
          !ReadOptionalBound(terms_json, "offset_end", &terms.offset_end, error)) {
        return false;
      }
      out.terms = std::move(terms);
    }
    if (json.contains("turbo")) {
      out.turbo = json.at("turbo").get<bool>();
    }
    if (json.contains("mint") && !json.at("mint").is_null()) {
      const auto& mint_json = json.at("mint");
      runes::MintReference mint;
      mint.txid = mint_json.at("txid").get<std::string>();
      if (!ReadUnsigned(mint_json.at("vout"), "vout", &mint.vout, error)) {
        return false;
      }
      out.mint = std::move(mint);
    }
    if (json.contains("pointer") && !json.at("pointer").is_null()) {
      std::uint32_t pointer = 0;
      if (!ReadUnsigned(json.at("pointer"), "pointer", &pointer, error)) {
        return false;
      }
      out.pointer = pointer;
    }
    if (json.contains("unrecognized")) {
      for (const auto& entry : json.at("unrecognized")) {
        runes::TaggedField field;
        if (!ReadBig(entry.at("tag"), "tag", &field.tag, error) ||
            !ReadBig(entry.at("value"), "value", &field.value, error)) {
          return false;
        }
        out.unrecognized.push_back(std::move(field));
      }
    }
    *spec = std::move(out);
    return true;
  } catch (const nlohmann::json::exception& ex) {
    if (error) *error = std::string("malformed etching JSON: ") + ex.what();
    return false;
  }
}

nlohmann::json EtchingToJson(const runes::EtchingSpec& spec) {
  nlohmann::json json = {
      {"name", spec.name},
      {"symbol", spec.symbol},
      {"divisibility", spec.divisibility},
      {"premine", spec.premine.str()},
      {"turbo", spec.turbo},
  };
  if (spec.terms) {
    nlohmann::json terms = {{"amount", spec.terms->amount.str()},
                            {"cap", spec.terms->cap.str()}};
    if (spec.terms->height_start) terms["height_start"] = *spec.terms->height_start;
    if (spec.terms->height_end) terms["height_end"] = *spec.terms->height_end;
    if (spec.terms->offset_start) terms["offset_start"] = *spec.terms->offset_start;
    if (spec.terms->offset_end) terms["offset_end"] = *spec.terms->offset_end;
    json["terms"] = std::move(terms);
  }
  if (spec.mint) {
    json["mint"] = {{"txid", spec.mint->txid}, {"vout", spec.mint->vout}};
  }
  if (spec.pointer) {
    json["pointer"] = *spec.pointer;
  }
  if (!spec.unrecognized.empty()) {
    nlohmann::json extra = nlohmann::json::array();
    for (const auto& field : spec.unrecognized) {
      extra.push_back({{"tag", field.tag.str()}, {"value", field.value.str()}});
    }
    json["unrecognized"] = std::move(extra);
  }
  return json;
}

nlohmann::json FieldsToJson(const std::vector<runes::TaggedField>& fields) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& field : fields) {
    out.push_back({{"tag", field.tag.str()},
                   {"name", std::string(runes::TagName(field.tag))},
                   {"value", field.value.str()}});
  }
  return out;
}

nlohmann::json RevealResultToJson(const RevealResult& result) {
  return {
      {"txid", result.txid},
      {"total_fee", result.total_fee},
      {"miner_fee", result.miner_fee},
      {"service_fee", result.service_fee},
      {"recipient_value", result.recipient_value},
      {"vsize", result.virtual_size},
  };
}

}  // namespace runeforge::etch
