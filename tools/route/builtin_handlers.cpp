// Demonstration implementations for the handlers in configs/handler.
//
// Each handler echoes what it was asked to do. A few also register a fast
// implementation so the tandem dispatch path is visible from the command line.

#include <string>
#include <string_view>

#include "switchyard/internal/handler/handler_auto_registry.h"
#include "switchyard/internal/handler/handler_call.h"
#include "switchyard/internal/handler/handler_table.h"

namespace {

namespace handler = ::switchyard::internal::handler;
namespace errs = ::switchyard::internal::diagnostics::error;

std::string summarize(const handler::HandlerCall &call, std::string_view action) {
  std::string out(call.handler_name);
  out += ": ";
  out += action;
  out += " for '";
  out += call.payload.normalized_input;
  out += "'";
  if (!call.payload.workflow.empty()) {
    out += " [workflow ";
    out += call.payload.workflow;
    out += "]";
  }
  return out;
}

handler::HandlerFn fallbackFor(std::string action) {
  return [action](const handler::HandlerCall &call) -> handler::HandlerOutput {
    if (call.cancel.cancelled()) {
      return handler::HandlerOutput::failure(errs::SwitchyardErrc::Cancelled);
    }
    return handler::HandlerOutput::success(summarize(call, action));
  };
}

handler::HandlerFn fastFor(std::string action) {
  return [action](const handler::HandlerCall &call) -> handler::HandlerOutput {
    return handler::HandlerOutput::success(summarize(call, action + " (fast path)"));
  };
}

void registerBuiltinHandlers(handler::HandlerTable &table) {
  table.registerHandler("DIRECTOR", fallbackFor("coordination plan drafted"));
  table.registerHandler("SECURITY", fallbackFor("security review queued"),
                        fastFor("signature scan complete"));
  table.registerHandler("OPTIMIZER", fallbackFor("profiling plan drafted"),
                        fastFor("hot paths ranked"));
  table.registerHandler("DEBUGGER", fallbackFor("failure triaged"));
  table.registerHandler("PATCHER", fallbackFor("patch proposed"));
  table.registerHandler("TESTBED", fallbackFor("test plan drafted"));
  table.registerHandler("LINTER", fallbackFor("lint findings collected"),
                        fastFor("lint findings collected"));
  table.registerHandler("DEPLOYER", fallbackFor("release checklist prepared"));
  table.registerHandler("INFRASTRUCTURE", fallbackFor("provisioning plan drafted"));
  table.registerHandler("MONITOR", fallbackFor("dashboards and alerts proposed"));
  table.registerHandler("ARCHITECT", fallbackFor("design notes drafted"));
  table.registerHandler("APIDESIGNER", fallbackFor("endpoint contract drafted"));
  table.registerHandler("DATABASE", fallbackFor("query plan reviewed"));
  table.registerHandler("MLOPS", fallbackFor("training pipeline outlined"),
                        fastFor("training pipeline outlined"));
  table.registerHandler("HARDWARE", fallbackFor("device telemetry collected"));
}

} // namespace

SWITCHYARD_REGISTER_HANDLERS(&registerBuiltinHandlers)
