/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/contract_abi.hpp"

#include <array>
#include <cstdio>
#include <memory>

#include <rapidjson/document.h>
#include <rapidjson/filereadstream.h>

OUTCOME_CPP_DEFINE_CATEGORY(eraoracle::parachain, ContractAbiError, e) {
  using E = eraoracle::parachain::ContractAbiError;
  switch (e) {
    case E::FILE_NOT_READABLE:
      return "ABI file can not be read";
    case E::MALFORMED_JSON:
      return "ABI file is not a json array";
    case E::MALFORMED_ENTRY:
      return "ABI entry has unexpected structure";
  }
  return "Unknown ContractAbiError";
}

namespace eraoracle::parachain {

  namespace {
    /**
     * Canonical type of a parameter; tuples are expanded recursively:
     * {type: "tuple[]", components: [...]} -> "(...)[]"
     */
    outcome::result<std::string> canonical_type(const rapidjson::Value &param) {
      if (not param.IsObject()) {
        return ContractAbiError::MALFORMED_ENTRY;
      }
      auto type_it = param.FindMember("type");
      if (type_it == param.MemberEnd() or not type_it->value.IsString()) {
        return ContractAbiError::MALFORMED_ENTRY;
      }
      std::string_view type{type_it->value.GetString(),
                            type_it->value.GetStringLength()};
      constexpr std::string_view kTuple = "tuple";
      if (not type.starts_with(kTuple)) {
        return std::string{type};
      }

      auto components_it = param.FindMember("components");
      if (components_it == param.MemberEnd()
          or not components_it->value.IsArray()) {
        return ContractAbiError::MALFORMED_ENTRY;
      }
      std::string result = "(";
      bool first = true;
      for (auto &component : components_it->value.GetArray()) {
        OUTCOME_TRY(component_type, canonical_type(component));
        if (not first) {
          result += ",";
        }
        first = false;
        result += component_type;
      }
      result += ")";
      result += type.substr(kTuple.size());
      return result;
    }

    outcome::result<void> collect_functions(
        const rapidjson::Document &document,
        std::set<std::string, std::less<>> &functions) {
      if (document.HasParseError() or not document.IsArray()) {
        return ContractAbiError::MALFORMED_JSON;
      }
      for (auto &entry : document.GetArray()) {
        if (not entry.IsObject()) {
          return ContractAbiError::MALFORMED_ENTRY;
        }
        auto type_it = entry.FindMember("type");
        if (type_it == entry.MemberEnd() or not type_it->value.IsString()
            or std::string_view{type_it->value.GetString()} != "function") {
          continue;
        }
        auto name_it = entry.FindMember("name");
        auto inputs_it = entry.FindMember("inputs");
        if (name_it == entry.MemberEnd() or not name_it->value.IsString()
            or inputs_it == entry.MemberEnd()
            or not inputs_it->value.IsArray()) {
          return ContractAbiError::MALFORMED_ENTRY;
        }
        std::string signature{name_it->value.GetString(),
                              name_it->value.GetStringLength()};
        signature += "(";
        bool first = true;
        for (auto &input : inputs_it->value.GetArray()) {
          OUTCOME_TRY(type, canonical_type(input));
          if (not first) {
            signature += ",";
          }
          first = false;
          signature += type;
        }
        signature += ")";
        functions.emplace(std::move(signature));
      }
      return outcome::success();
    }
  }  // namespace

  outcome::result<ContractAbi> ContractAbi::load(
      const std::filesystem::path &path) {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;
    FilePtr file(std::fopen(path.c_str(), "r"), &std::fclose);
    if (not file) {
      return ContractAbiError::FILE_NOT_READABLE;
    }

    std::array<char, 4096> buffer{};
    rapidjson::FileReadStream input_stream(
        file.get(), buffer.data(), buffer.size());
    rapidjson::Document document;
    document.ParseStream(input_stream);

    ContractAbi abi;
    OUTCOME_TRY(collect_functions(document, abi.functions_));
    return abi;
  }

  outcome::result<ContractAbi> ContractAbi::parse(std::string_view json) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());

    ContractAbi abi;
    OUTCOME_TRY(collect_functions(document, abi.functions_));
    return abi;
  }

  bool ContractAbi::hasFunction(std::string_view signature) const {
    return functions_.find(signature) != functions_.end();
  }

}  // namespace eraoracle::parachain
