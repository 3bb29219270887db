#include "handlers/tasks_handler.hpp"

#include <algorithm>

#include <boost/json.hpp>
#include <fmt/format.h>

namespace kubeplane {

namespace {

std::string format_ms(const std::optional<std::int64_t> &ms) {
  if (!ms) {
    return "-";
  }
  return fmt::format("{}", *ms);
}

} // namespace

TasksHandler::TasksHandler(CliCtx &cli_ctx, customio::ConsoleOutput &output,
                           workflows::TaskRepository &repository)
    : cli_ctx_(cli_ctx), output_(output), repository_(repository) {}

monad::IO<void> TasksHandler::start() {
  const std::string action = cli_ctx_.action();
  if (action == "list") {
    return handle_list();
  }
  if (action == "show") {
    return handle_show();
  }
  if (action == "purge") {
    return handle_purge();
  }
  return monad::IO<void>::fail(monad::make_error(
      my_errors::GENERAL::SHOW_OPT_DESC,
      "Usage: kubeplane tasks <list|show <id>|purge --cluster <name>> "
      "[--json]"));
}

TasksHandler::Options TasksHandler::parse_options(const std::string &action) {
  Options opts;
  opts.json = cli_ctx_.params.json;

  po::options_description desc("tasks options");
  desc.add_options()("cluster", po::value<std::string>(),
                     "Only tasks of this cluster");
  try {
    auto args = filter_tokens(cli_ctx_.unrecognized,
                              std::vector<std::string>{command(), action});
    po::variables_map vm;
    po::store(po::command_line_parser(args)
                  .options(desc)
                  .allow_unregistered()
                  .run(),
              vm);
    po::notify(vm);
    if (vm.count("cluster")) {
      opts.cluster = vm["cluster"].as<std::string>();
    }
  } catch (const std::exception &ex) {
    output_.logger().warning()
        << "Failed to parse tasks " << action << " options: " << ex.what()
        << std::endl;
  }
  return opts;
}

monad::IO<void> TasksHandler::handle_list() {
  auto options = parse_options("list");
  auto tasks = options.cluster ? repository_.list_by_cluster(*options.cluster)
                               : repository_.list_all();
  if (tasks.is_err()) {
    return monad::IO<void>::fail(std::move(tasks).error());
  }

  auto [offset, limit] = cli_ctx_.offset_limit();
  const auto &all = tasks.value();
  auto first = std::min(offset, all.size());
  auto last = std::min(all.size(), first + limit);

  if (options.json) {
    boost::json::array arr;
    for (auto i = first; i < last; ++i) {
      const auto &task = all[i];
      arr.push_back(boost::json::object{
          {"id", task.id},
          {"type", task.type},
          {"cluster", task.config.cluster_name},
          {"status", workflows::to_string(task.status)}});
    }
    output_.out() << boost::json::serialize(arr) << std::endl;
    return monad::IO<void>::pure();
  }

  if (all.empty()) {
    output_.logger().info() << "No tasks found." << std::endl;
    return monad::IO<void>::pure();
  }
  output_.out() << fmt::format("{:<40} {:<32} {:<20} {}\n", "ID", "TYPE",
                               "CLUSTER", "STATUS");
  for (auto i = first; i < last; ++i) {
    const auto &task = all[i];
    output_.out() << fmt::format("{:<40} {:<32} {:<20} {}\n", task.id,
                                 task.type, task.config.cluster_name,
                                 workflows::to_string(task.status));
  }
  if (last < all.size()) {
    output_.logger().info() << (all.size() - last)
                            << " more; use --offset/--limit" << std::endl;
  }
  return monad::IO<void>::pure();
}

monad::IO<void> TasksHandler::handle_show() {
  auto options = parse_options("show");
  auto id = cli_ctx_.argument(0, "Task id");
  if (id.is_err()) {
    return monad::IO<void>::fail(std::move(id).error());
  }
  auto task = repository_.load(id.value());
  if (task.is_err()) {
    return monad::IO<void>::fail(std::move(task).error());
  }
  if (options.json) {
    output_.out() << boost::json::serialize(boost::json::value_from(task.value()))
                  << std::endl;
    return monad::IO<void>::pure();
  }
  print_task(task.value());
  return monad::IO<void>::pure();
}

monad::IO<void> TasksHandler::handle_purge() {
  auto options = parse_options("purge");
  if (!options.cluster) {
    return monad::IO<void>::fail(
        monad::make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                          "--cluster must be provided for purge."));
  }
  auto removed = repository_.delete_by_cluster(*options.cluster);
  if (removed.is_err()) {
    return monad::IO<void>::fail(std::move(removed).error());
  }
  output_.logger().info() << "Removed " << removed.value()
                          << " tasks of cluster " << *options.cluster
                          << std::endl;
  return monad::IO<void>::pure();
}

void TasksHandler::print_task(const workflows::Task &task) {
  auto &out = output_.out();
  out << "Task " << task.id << "\n";
  out << "  Type: " << task.type << "\n";
  out << "  Cluster: " << task.config.cluster_name << "\n";
  if (task.config.node) {
    out << "  Node: " << task.config.node->name << "\n";
  }
  out << "  Status: " << workflows::to_string(task.status) << "\n";
  out << "  Steps:\n";
  for (std::size_t i = 0; i < task.steps_statuses.size(); ++i) {
    const auto &step = task.steps_statuses[i];
    out << fmt::format("    {}. {:<28} {:<8} started={} finished={}\n", i + 1,
                       step.name, workflows::to_string(step.state),
                       format_ms(step.started_at_ms),
                       format_ms(step.finished_at_ms));
    if (step.error_message) {
      out << "       error: " << *step.error_message << "\n";
    }
  }
  out.flush();
}

} // namespace kubeplane
