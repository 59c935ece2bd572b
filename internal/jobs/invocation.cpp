#include "invocation.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace jobstore::jobs {

namespace v1 = jobstore::documents::v1;

v1::InvocationData ToProto(const Invocation& invocation) {
  v1::InvocationData data;
  data.set_type(invocation.type);
  data.set_method(invocation.method);
  for (const auto& t : invocation.parameter_types) data.add_parameter_types(t);
  for (const auto& a : invocation.arguments) data.add_arguments(a);
  for (const auto& g : invocation.generic_arguments) data.add_generic_arguments(g);
  return data;
}

Invocation FromProto(const v1::InvocationData& data) {
  Invocation invocation;
  invocation.type   = data.type();
  invocation.method = data.method();
  invocation.parameter_types.assign(data.parameter_types().begin(), data.parameter_types().end());
  invocation.arguments.assign(data.arguments().begin(), data.arguments().end());
  invocation.generic_arguments.assign(data.generic_arguments().begin(), data.generic_arguments().end());
  return invocation;
}

std::string SerializeInvocation(const Invocation& invocation) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(invocation), &json);
  if (!status.ok()) {
    throw util::InvocationError("failed to serialize invocation: " + std::string(status.message()));
  }
  return json;
}

Invocation ParseInvocation(const std::string& json) {
  v1::InvocationData data;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &data, options);
  if (!status.ok()) {
    throw util::InvocationError("malformed invocation: " + std::string(status.message()));
  }

  auto invocation = FromProto(data);
  ValidateInvocation(invocation);
  return invocation;
}

void ValidateInvocation(const Invocation& invocation) {
  if (invocation.type.empty()) {
    throw util::InvocationError("invocation has no type");
  }
  if (invocation.method.empty()) {
    throw util::InvocationError("invocation of " + invocation.type + " has no method");
  }
  if (invocation.arguments.size() != invocation.parameter_types.size()) {
    throw util::InvocationError("invocation " + Signature(invocation) + " expects " + std::to_string(invocation.parameter_types.size()) +
                                " arguments, got " + std::to_string(invocation.arguments.size()));
  }
}

static std::string SignatureOf(const std::string& type, const std::string& method, const std::vector<std::string>& parameter_types) {
  std::string signature = type + "." + method + "(";
  for (std::size_t i = 0; i < parameter_types.size(); ++i) {
    if (i > 0) signature += ",";
    signature += parameter_types[i];
  }
  signature += ")";
  return signature;
}

std::string Signature(const Invocation& invocation) {
  return SignatureOf(invocation.type, invocation.method, invocation.parameter_types);
}

void InvocationRegistry::Register(const std::string& type, const std::string& method, const std::vector<std::string>& parameter_types,
                                  Handler handler) {
  if (!handler) {
    throw std::invalid_argument("handler must be callable");
  }
  handlers_[SignatureOf(type, method, parameter_types)] = std::move(handler);
}

bool InvocationRegistry::Contains(const Invocation& invocation) const {
  return handlers_.count(Signature(invocation)) > 0;
}

const InvocationRegistry::Handler& InvocationRegistry::Resolve(const Invocation& invocation) const {
  ValidateInvocation(invocation);

  auto it = handlers_.find(Signature(invocation));
  if (it == handlers_.end()) {
    throw util::InvocationError("no handler registered for " + Signature(invocation));
  }
  return it->second;
}

void InvocationRegistry::Invoke(const JobContext& context) const {
  Resolve(context.invocation)(context);
}

} // namespace jobstore::jobs
