#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "internal/util/cancellation.hpp"
#include "jobstore/documents/v1/documents.pb.h"

namespace jobstore::jobs {

/*
  Invocation

  Portable description of "what to call": a type name, a method name, the
  parameter type names and one serialized argument string per parameter.
  The store never interprets it; workers resolve it through an
  InvocationRegistry.
*/
struct Invocation {
  std::string              type;
  std::string              method;
  std::vector<std::string> parameter_types;
  std::vector<std::string> arguments;
  std::vector<std::string> generic_arguments;

  bool operator==(const Invocation&) const = default;
};

jobstore::documents::v1::InvocationData ToProto(const Invocation& invocation);
Invocation                              FromProto(const jobstore::documents::v1::InvocationData& data);

// JSON form used by tools and logs.
std::string SerializeInvocation(const Invocation& invocation);

// Throws util::InvocationError on malformed input.
Invocation ParseInvocation(const std::string& json);

// Throws util::InvocationError when type or method is missing or the
// argument count does not match the parameter types.
void ValidateInvocation(const Invocation& invocation);

// "Type.Method(ParamA,ParamB)"
std::string Signature(const Invocation& invocation);

struct JobContext {
  std::string                        job_id;
  std::string                        queue;
  const Invocation&                  invocation;
  std::map<std::string, std::string> parameters;
  util::CancellationToken            cancellation;
};

/*
  Maps invocation signatures to handlers. Registration happens at startup;
  lookups are read-only afterwards, so no locking.
*/
class InvocationRegistry {
 public:
  using Handler = std::function<void(const JobContext&)>;

  void Register(const std::string& type, const std::string& method, const std::vector<std::string>& parameter_types, Handler handler);

  bool Contains(const Invocation& invocation) const;

  // Throws util::InvocationError when nothing is registered for the signature.
  const Handler& Resolve(const Invocation& invocation) const;

  void Invoke(const JobContext& context) const;

  std::size_t Size() const {
    return handlers_.size();
  }

 private:
  std::map<std::string, Handler> handlers_;
};

} // namespace jobstore::jobs
