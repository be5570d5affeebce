/**
 * @file HypervisorState.cpp
 * @brief JSON codec for persisted driver state.
 */

#include "src/storage/inc/HypervisorState.hpp"

#include <memory>  // std::unique_ptr
#include <utility> // std::move

namespace hvdriver {

namespace storage {

namespace {

/* ----------------------------- Field Readers ----------------------------- */

bool readString(const Json::Value& obj, const char* key, std::string& out) {
  const Json::Value& v = obj[key];
  if (!v.isString()) {
    return false;
  }
  out = v.asString();
  return true;
}

bool readUInt(const Json::Value& obj, const char* key, std::uint32_t& out) {
  const Json::Value& v = obj[key];
  if (!v.isUInt()) {
    return false;
  }
  out = v.asUInt();
  return true;
}

bool readBool(const Json::Value& obj, const char* key, bool& out) {
  const Json::Value& v = obj[key];
  if (!v.isBool()) {
    return false;
  }
  out = v.asBool();
  return true;
}

bool readParams(const Json::Value& arr, std::vector<config::Param>& out) {
  if (!arr.isArray()) {
    return false;
  }
  out.clear();
  out.reserve(arr.size());
  for (const Json::Value& item : arr) {
    if (!item.isObject()) {
      return false;
    }
    config::Param p{};
    if (!readString(item, "key", p.key) || !readString(item, "value", p.value)) {
      return false;
    }
    out.push_back(std::move(p));
  }
  return true;
}

bool readTokens(const Json::Value& arr, std::vector<std::string>& out) {
  if (!arr.isArray()) {
    return false;
  }
  out.clear();
  out.reserve(arr.size());
  for (const Json::Value& item : arr) {
    if (!item.isString()) {
      return false;
    }
    out.push_back(item.asString());
  }
  return true;
}

bool readConfig(const Json::Value& obj, config::HypervisorConfig& out) {
  if (!obj.isObject()) {
    return false;
  }
  return readString(obj, "kernelPath", out.kernelPath) &&
         readString(obj, "imagePath", out.imagePath) &&
         readString(obj, "hypervisorPath", out.hypervisorPath) &&
         readString(obj, "machineType", out.machineType) &&
         readUInt(obj, "defaultVcpus", out.defaultVcpus) &&
         readUInt(obj, "defaultMemSzMiB", out.defaultMemSzMiB) &&
         readUInt(obj, "defaultBridges", out.defaultBridges) &&
         readBool(obj, "debug", out.debug) && readParams(obj["kernelParams"], out.kernelParams);
}

} // namespace

/* ----------------------------- API ----------------------------- */

Json::Value toJson(const HypervisorState& state) {
  const config::HypervisorConfig& c = state.config;

  Json::Value params(Json::arrayValue);
  for (const config::Param& p : c.kernelParams) {
    Json::Value item;
    item["key"] = p.key;
    item["value"] = p.value;
    params.append(item);
  }

  Json::Value cfg;
  cfg["kernelPath"] = c.kernelPath;
  cfg["imagePath"] = c.imagePath;
  cfg["hypervisorPath"] = c.hypervisorPath;
  cfg["machineType"] = c.machineType;
  cfg["defaultVcpus"] = Json::UInt(c.defaultVcpus);
  cfg["defaultMemSzMiB"] = Json::UInt(c.defaultMemSzMiB);
  cfg["defaultBridges"] = Json::UInt(c.defaultBridges);
  cfg["debug"] = c.debug;
  cfg["kernelParams"] = params;

  Json::Value tokens(Json::arrayValue);
  for (const std::string& t : state.kernelParams) {
    tokens.append(t);
  }

  Json::Value root;
  root["version"] = Json::UInt(state.version);
  root["hypervisorConfig"] = cfg;
  root["hypervisorPath"] = state.hypervisorPath;
  root["kernelParams"] = tokens;
  return root;
}

Status fromJson(const Json::Value& value, HypervisorState& out) {
  if (!value.isObject()) {
    return Status::SCHEMA_MISMATCH;
  }

  HypervisorState state{};
  if (!readUInt(value, "version", state.version) || state.version != STATE_SCHEMA_VERSION) {
    return Status::SCHEMA_MISMATCH;
  }
  if (!readConfig(value["hypervisorConfig"], state.config) ||
      !readString(value, "hypervisorPath", state.hypervisorPath) ||
      !readTokens(value["kernelParams"], state.kernelParams)) {
    return Status::SCHEMA_MISMATCH;
  }

  out = std::move(state);
  return Status::OK;
}

std::string serializeState(const HypervisorState& state) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, toJson(state)) + "\n";
}

Status parseState(const std::string& text, HypervisorState& out) {
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> READER(builder.newCharReader());

  Json::Value root;
  std::string errs;
  if (!READER->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    return Status::SCHEMA_MISMATCH;
  }
  return fromJson(root, out);
}

} // namespace storage

} // namespace hvdriver
