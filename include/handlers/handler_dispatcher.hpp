#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "handlers/i_handler.hpp"
#include "io_monad.hpp"
#include "kubeplane_common.hpp"
#include "log_stream.hpp"

namespace kubeplane {

// Lifetime: created via DI inside App::start and kept on the stack for the
// duration of the CLI session.
class HandlerDispatcher {
  customio::IOutput &output_;
  kubeplane::CliCtx &cli_ctx_;
  IHandlerFactory &handler_factory_;

public:
  HandlerDispatcher(customio::IOutput &out, //
                    kubeplane::CliCtx &ctx, //
                    IHandlerFactory &handler_factory)
      : output_(out), cli_ctx_(ctx), handler_factory_(handler_factory) {}

  // False when no handler could be created for `subcmd`; `cont` is then
  // never called.
  bool dispatch_run(const std::string &subcmd,
                    std::function<void(monad::MyResult<void> &&)> cont) {
    std::shared_ptr<IHandler> handler;
    try {
      handler = handler_factory_.create(subcmd);
    } catch (const std::exception &ex) {
      output_.debug() << "no handler for " << subcmd << ": " << ex.what()
                      << std::endl;
      return false;
    }
    output_.trace() << "dispatching " << handler->command() << " with "
                    << cli_ctx_.positionals.size() << " positionals"
                    << std::endl;
    handler->start().run(std::move(cont));
    return true;
  }
};

} // namespace kubeplane
