#include "coordinator/wire.hpp"

#include <kj/debug.h>

namespace coordinator {

namespace {
std::string ToString(capnp::Text::Reader text) {
  return std::string(text.cStr(), text.size());
}

std::string ToString(capnp::Data::Reader data) {
  return std::string(reinterpret_cast<const char*>(data.begin()), data.size());
}

kj::StringPtr ToText(const std::string& s) {
  return kj::StringPtr(s.c_str(), s.size());
}

kj::ArrayPtr<const kj::byte> ToData(const std::string& s) {
  return kj::arrayPtr(reinterpret_cast<const kj::byte*>(s.data()), s.size());
}

struct KindMapping {
  ErrorKind kind;
  capnproto::ExecutionError::Kind wire;
};

const KindMapping kKinds[] = {
    {ErrorKind::INVALID_REQUEST,
     capnproto::ExecutionError::Kind::INVALID_REQUEST},
    {ErrorKind::REJECTED_BINDING,
     capnproto::ExecutionError::Kind::REJECTED_BINDING},
    {ErrorKind::SYNTAX_FAULT, capnproto::ExecutionError::Kind::SYNTAX_FAULT},
    {ErrorKind::RUNTIME_FAULT, capnproto::ExecutionError::Kind::RUNTIME_FAULT},
    {ErrorKind::TIMED_OUT, capnproto::ExecutionError::Kind::TIMED_OUT},
    {ErrorKind::RESOURCE_EXCEEDED,
     capnproto::ExecutionError::Kind::RESOURCE_EXCEEDED},
    {ErrorKind::TERMINATION_FAULT,
     capnproto::ExecutionError::Kind::TERMINATION_FAULT},
    {ErrorKind::CANCELLED, capnproto::ExecutionError::Kind::CANCELLED},
    {ErrorKind::INTERNAL_ERROR,
     capnproto::ExecutionError::Kind::INTERNAL_ERROR},
};
}  // namespace

void Wire::WriteValue(const script::Value& value,
                      capnproto::Value::Builder builder) {
  switch (value.type()) {
    case script::Value::Type::NONE:
      builder.setNone();
      break;
    case script::Value::Type::BOOL:
      builder.setBool(value.AsBool());
      break;
    case script::Value::Type::INT:
      builder.setInt(value.AsInt());
      break;
    case script::Value::Type::FLOAT:
      builder.setFloat(value.AsFloat());
      break;
    case script::Value::Type::STR:
      builder.setText(ToText(value.AsStr()));
      break;
    case script::Value::Type::LIST: {
      const script::List& items = value.AsList();
      auto list = builder.initList(items.size());
      for (size_t i = 0; i < items.size(); i++) {
        WriteValue(items[i], list[i]);
      }
      break;
    }
    case script::Value::Type::DICT: {
      const auto& items = value.AsDict().Items();
      auto map = builder.initMap(items.size());
      for (size_t i = 0; i < items.size(); i++) {
        WriteValue(items[i].first, map[i].initKey());
        WriteValue(items[i].second, map[i].initValue());
      }
      break;
    }
    case script::Value::Type::SET: {
      const auto& items = value.AsSet().Items();
      auto set = builder.initSet(items.size());
      for (size_t i = 0; i < items.size(); i++) {
        WriteValue(items[i].first, set[i]);
      }
      break;
    }
    case script::Value::Type::RANGE:
    case script::Value::Type::CALLABLE:
    case script::Value::Type::MODULE:
      KJ_FAIL_REQUIRE("value cannot be serialized", value.TypeName());
  }
}

script::Value Wire::ReadValue(capnproto::Value::Reader reader) {
  return ReadValue(reader, 0);
}

script::Value Wire::ReadValue(capnproto::Value::Reader reader, int depth) {
  KJ_REQUIRE(depth <= script::Value::kMaxTransferDepth,
             "value nested too deeply");
  switch (reader.which()) {
    case capnproto::Value::NONE:
      return script::Value::None();
    case capnproto::Value::BOOL:
      return script::Value::Bool(reader.getBool());
    case capnproto::Value::INT:
      return script::Value::Int(reader.getInt());
    case capnproto::Value::FLOAT:
      return script::Value::Float(reader.getFloat());
    case capnproto::Value::TEXT:
      return script::Value::Str(ToString(reader.getText()));
    case capnproto::Value::LIST: {
      script::List items;
      for (auto item : reader.getList()) {
        items.push_back(ReadValue(item, depth + 1));
      }
      return script::Value::NewList(std::move(items));
    }
    case capnproto::Value::MAP: {
      script::Value dict = script::Value::NewDict();
      for (auto entry : reader.getMap()) {
        script::Value key = ReadValue(entry.getKey(), depth + 1);
        KJ_REQUIRE(!key.IsList() && !key.IsDict() && !key.IsSet(),
                   "map keys must be scalar");
        dict.AsDict().Set(key, ReadValue(entry.getValue(), depth + 1));
      }
      return dict;
    }
    case capnproto::Value::SET: {
      script::Value set = script::Value::NewSet();
      for (auto item : reader.getSet()) {
        script::Value element = ReadValue(item, depth + 1);
        KJ_REQUIRE(!element.IsList() && !element.IsDict() && !element.IsSet(),
                   "set elements must be scalar");
        set.SetAdd(element);
      }
      return set;
    }
  }
  KJ_FAIL_REQUIRE("unknown value type", static_cast<int>(reader.which()));
}

void Wire::WriteBindings(const std::map<std::string, script::Value>& bindings,
                         capnp::List<capnproto::Binding>::Builder builder) {
  size_t i = 0;
  for (const auto& entry : bindings) {
    builder[i].setName(ToText(entry.first));
    WriteValue(entry.second, builder[i].initValue());
    i++;
  }
}

std::map<std::string, script::Value> Wire::ReadBindings(
    capnp::List<capnproto::Binding>::Reader reader) {
  std::map<std::string, script::Value> bindings;
  for (auto binding : reader) {
    std::string name = ToString(binding.getName());
    KJ_REQUIRE(bindings.count(name) == 0, "duplicate binding", name);
    bindings.emplace(name, ReadValue(binding.getValue()));
  }
  return bindings;
}

void Wire::WriteRequest(const ExecutionRequest& request,
                        capnproto::ExecutionRequest::Builder builder) {
  builder.setCode(ToText(request.code));
  WriteBindings(request.bindings,
                builder.initBindings(request.bindings.size()));
  builder.setTimeoutMillis(request.timeout_millis);
  builder.setTier(request.tier == policy::Tier::ANALYSIS
                      ? capnproto::CapabilityTier::ANALYSIS
                      : capnproto::CapabilityTier::MINIMAL);
  auto observe = builder.initObserve(request.observe.size());
  for (size_t i = 0; i < request.observe.size(); i++) {
    observe.set(i, ToText(request.observe[i]));
  }
}

ExecutionRequest Wire::ReadRequest(capnproto::ExecutionRequest::Reader reader) {
  ExecutionRequest request;
  request.code = ToString(reader.getCode());
  request.bindings = ReadBindings(reader.getBindings());
  request.timeout_millis = reader.getTimeoutMillis();
  request.tier = policy::TierFromRaw(static_cast<int>(reader.getTier()));
  for (auto name : reader.getObserve()) {
    request.observe.push_back(ToString(name));
  }
  return request;
}

void Wire::WriteError(const ExecutionError& error,
                      capnproto::ExecutionError::Builder builder) {
  for (const KindMapping& mapping : kKinds) {
    if (mapping.kind == error.kind) builder.setKind(mapping.wire);
  }
  builder.setLabel(ToText(error.label));
  builder.setMessage(ToText(error.message));
  builder.setLine(error.line);
  builder.setColumn(error.column);
  builder.setElapsedMillis(error.elapsed_millis);
  builder.setLimitMillis(error.limit_millis);
  builder.setResource(ToText(error.resource));
}

ExecutionError Wire::ReadError(capnproto::ExecutionError::Reader reader) {
  ExecutionError error;
  error.kind = ErrorKind::INTERNAL_ERROR;
  for (const KindMapping& mapping : kKinds) {
    if (mapping.wire == reader.getKind()) error.kind = mapping.kind;
  }
  error.label = ToString(reader.getLabel());
  error.message = ToString(reader.getMessage());
  error.line = reader.getLine();
  error.column = reader.getColumn();
  error.elapsed_millis = reader.getElapsedMillis();
  error.limit_millis = reader.getLimitMillis();
  error.resource = ToString(reader.getResource());
  return error;
}

void Wire::WriteResult(const ExecutionResult& result,
                       capnproto::ExecutionResult::Builder builder) {
  builder.setSucceeded(result.succeeded_);
  if (result.has_result_) {
    WriteValue(result.result_, builder.getResult().initValue());
  } else {
    builder.getResult().setAbsent();
  }
  auto out = builder.initStandardOutput();
  out.setData(ToData(result.stdout_.data));
  out.setTruncated(result.stdout_.truncated);
  auto err = builder.initStandardError();
  err.setData(ToData(result.stderr_.data));
  err.setTruncated(result.stderr_.truncated);
  if (result.has_error_) {
    WriteError(result.error_, builder.getError().initError());
  } else {
    builder.getError().setNone();
  }
  WriteBindings(result.updated_bindings_,
                builder.initUpdatedBindings(result.updated_bindings_.size()));
  auto usage = builder.initUsage();
  usage.setWallMillis(result.usage_.wall_millis);
  usage.setCpuMillis(result.usage_.cpu_millis);
  usage.setSysMillis(result.usage_.sys_millis);
  usage.setPeakMemoryKb(result.usage_.peak_memory_kb);
}

ExecutionResult Wire::ReadResult(capnproto::ExecutionResult::Reader reader) {
  ExecutionResult result;
  result.succeeded_ = reader.getSucceeded();
  if (reader.getResult().which() ==
      capnproto::ExecutionResult::Result::VALUE) {
    result.has_result_ = true;
    result.result_ = ReadValue(reader.getResult().getValue());
  }
  result.stdout_.data = ToString(reader.getStandardOutput().getData());
  result.stdout_.truncated = reader.getStandardOutput().getTruncated();
  result.stderr_.data = ToString(reader.getStandardError().getData());
  result.stderr_.truncated = reader.getStandardError().getTruncated();
  if (reader.getError().which() == capnproto::ExecutionResult::Error::ERROR) {
    result.has_error_ = true;
    result.error_ = ReadError(reader.getError().getError());
  }
  result.updated_bindings_ = ReadBindings(reader.getUpdatedBindings());
  auto usage = reader.getUsage();
  result.usage_.wall_millis = usage.getWallMillis();
  result.usage_.cpu_millis = usage.getCpuMillis();
  result.usage_.sys_millis = usage.getSysMillis();
  result.usage_.peak_memory_kb = usage.getPeakMemoryKb();
  return result;
}

}  // namespace coordinator
