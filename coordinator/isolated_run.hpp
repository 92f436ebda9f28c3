#ifndef COORDINATOR_ISOLATED_RUN_HPP
#define COORDINATOR_ISOLATED_RUN_HPP

#include <string>
#include <vector>

#include "capnp/execution.capnp.h"
#include "context/context_builder.hpp"
#include "sandbox/governor.hpp"

namespace coordinator {

// Descriptors of the isolated child, in the order the streams are handed to
// the governor.
const constexpr int kReportFd = sandbox::Governor::kFirstStreamFd;
const constexpr int kStdoutPipeFd = kReportFd + 1;
const constexpr int kStderrPipeFd = kReportFd + 2;

// Body of the isolated child. Parses and runs code against the context with
// the standard channels redirected to the capture pipes, then writes a
// RunReport to kReportFd. Returns the exit code of the child.
int RunIsolated(const std::string& code,
                const context::ExecutionContext& context,
                const std::vector<std::string>& observe);

// Fills report from a finished interpreter, or with a fault if the result
// cannot be transferred back.
void BuildReport(const script::Interpreter& interpreter,
                 const std::vector<std::string>& observe,
                 capnproto::RunReport::Builder report);

}  // namespace coordinator

#endif
