#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cluster/cluster_operations.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "kubeplane_common.hpp"
#include "storage/cluster_store.hpp"
#include "workflows/run_context.hpp"

namespace kubeplane {

// kubeplane cluster <import|list|show|delete|delete-node|add-nodes|tasks>
//
// Workflow actions block until every started task has finished and its
// cluster record update has been applied or given up.
class ClusterHandler : public IHandler,
                       public std::enable_shared_from_this<ClusterHandler> {
public:
  ClusterHandler(CliCtx &cli_ctx, customio::ConsoleOutput &output,
                 std::shared_ptr<cluster::ClusterOperations> operations,
                 storage::ClusterStore &clusters,
                 std::shared_ptr<workflows::RunContext> session_ctx);

  std::string command() const override { return "cluster"; }
  monad::IO<void> start() override;

private:
  struct AddNodesOptions {
    std::optional<std::string> profiles_file;
    std::string role{"node"};
    std::string size;
    std::string image;
    int count{1};
  };

  AddNodesOptions parse_add_nodes_options();
  monad::MyResult<std::vector<model::NodeProfile>>
  load_profiles(const AddNodesOptions &options);

  monad::IO<void> handle_import();
  monad::IO<void> handle_list();
  monad::IO<void> handle_show();
  monad::IO<void> handle_delete();
  monad::IO<void> handle_delete_node();
  monad::IO<void> handle_add_nodes();
  monad::IO<void> handle_tasks();

  class OutcomeWaiter;
  std::shared_ptr<OutcomeWaiter> watch_outcomes();

  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;
  std::shared_ptr<cluster::ClusterOperations> operations_;
  storage::ClusterStore &clusters_;
  std::shared_ptr<workflows::RunContext> session_ctx_;
};

} // namespace kubeplane
