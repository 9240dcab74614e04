#include "engine.h"

#include "extract.h"
#include "fetch.h"
#include "inject.h"
#include "output_locator.h"
#include "template.h"
#include "tui.h"
#include "util.h"

#include <tbb/flow_graph.h>

#include <exception>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace hijack {
namespace {

// Per-package state carried from planning through injection. Each acquire node owns
// exactly one slot, so no locking is needed.
struct package_slot {
  package_plan plan;
  std::filesystem::path staging_dir;
  std::optional<fetched_resource> fetched;
  std::optional<extract_result> extracted;
  std::optional<package_failure> failure;
  std::vector<std::filesystem::path> injected;
};

template <typename Fn>
void record_failures(std::string const &package,
                     std::optional<package_failure> &failure,
                     Fn &&fn) {
  try {
    fn();
  } catch (hijack_error const &e) {
    failure = package_failure{ .kind = e.kind(), .message = e.what() };
  } catch (std::exception const &e) {
    failure = package_failure{ .kind = error_kind::filesystem_error, .message = e.what() };
  }
  if (failure) {
    tui::error("%s: %s", package.c_str(), failure->message.c_str());
  }
}

std::filesystem::path watch_path(std::filesystem::path const &target,
                                 std::filesystem::path const &project_root) {
  if (project_root.empty()) { return target; }
  auto const rel{ target.lexically_relative(project_root) };
  if (rel.empty() || *rel.begin() == "..") { return target; }
  return rel;
}

void acquire(package_slot &slot) {
  record_failures(slot.plan.name, slot.failure, [&] {
    slot.fetched = fetch(*slot.plan.locator, slot.staging_dir);
    slot.extracted = extract_artifacts(slot.fetched->path,
                                       slot.fetched->kind,
                                       slot.staging_dir / "extract",
                                       slot.plan.spec.export_name);
  });
}

void inject_package(package_slot &slot, output_locator const &outputs) {
  record_failures(slot.plan.name, slot.failure, [&] {
    std::visit(
        match{
            [&](raw_artifact const &raw) {
              auto placement{ slot.plan.spec.placement };
              if (!slot.fetched->is_original_source &&
                  placement != placement_strategy::copy) {
                tui::debug("%s: staged download is copied, not linked",
                           slot.plan.name.c_str());
                placement = placement_strategy::copy;
              }
              inject(raw.path, slot.plan.target, placement);
              slot.injected.push_back(slot.plan.target);
            },
            [&](archive_manifest const &manifest) {
              if (slot.plan.spec.placement != placement_strategy::copy) {
                tui::debug("%s: archive entries are copied, not linked",
                           slot.plan.name.c_str());
              }
              inject(manifest.primary, slot.plan.target, placement_strategy::copy);
              slot.injected.push_back(slot.plan.target);

              for (auto const &aux : manifest.auxiliaries) {
                auto const target{ outputs.auxiliary_target(aux.file_name) };
                inject(aux.path, target, placement_strategy::copy);
                slot.injected.push_back(target);
              }
            },
        },
        *slot.extracted);
  });
}

std::vector<package_plan> plan_packages(hijack_config const &config,
                                        build_context const &ctx,
                                        output_locator const &outputs) {
  std::vector<package_plan> plans;
  plans.reserve(config.packages.size());

  for (auto const &[name, spec] : config.packages) {
    package_plan plan{ .name = name, .spec = spec };
    if (spec.failure) {
      tui::error("%s: %s", name.c_str(), spec.failure->message.c_str());
      plan.failure = spec.failure;
      plans.push_back(std::move(plan));
      continue;
    }

    record_failures(name, plan.failure, [&] {
      template_context const tctx{ ctx, config.substitutions, spec.version };
      plan.locator = locator_resolve(name, spec, tctx, ctx.project_root);
      plan.target = outputs.locate(name);
    });
    plans.push_back(std::move(plan));
  }

  return plans;
}

}  // namespace

bool delivery_report::ok() const { return failed_count() == 0; }

std::size_t delivery_report::failed_count() const {
  std::size_t failed{ 0 };
  for (auto const &outcome : outcomes) {
    if (!outcome.ok()) { ++failed; }
  }
  return failed;
}

std::string delivery_report::summary() const {
  std::ostringstream oss;
  oss << failed_count() << " of " << outcomes.size() << " package(s) failed";
  for (auto const &outcome : outcomes) {
    if (outcome.ok()) { continue; }
    oss << "\n  " << outcome.name << ": [" << error_kind_name(outcome.failure->kind)
        << "] " << outcome.failure->message;
  }
  return oss.str();
}

std::vector<package_plan> engine_plan(hijack_config const &config,
                                      build_context const &ctx,
                                      deliver_options const &options) {
  auto const outputs{ output_locator::scan(ctx.deps_dir, options.emit_directives) };
  return plan_packages(config, ctx, outputs);
}

delivery_report deliver(hijack_config const &config,
                        build_context const &ctx,
                        deliver_options const &options) {
  auto const outputs{ output_locator::scan(ctx.deps_dir, options.emit_directives) };

  auto const staging_parent{ options.staging_parent.empty()
                                 ? std::filesystem::temp_directory_path()
                                 : options.staging_parent };
  scoped_path_cleanup staging_root{ util_unique_path(staging_parent, "hijack-") };

  std::vector<package_slot> slots;
  for (auto &plan : plan_packages(config, ctx, outputs)) {
    package_slot slot{ .plan = std::move(plan) };
    slot.failure = slot.plan.failure;
    slot.staging_dir = staging_root.path() / std::to_string(slots.size());
    slots.push_back(std::move(slot));
  }

  tbb::flow::graph graph;
  std::vector<std::unique_ptr<tbb::flow::continue_node<tbb::flow::continue_msg>>> nodes;
  for (auto &slot : slots) {
    if (slot.failure) { continue; }
    nodes.push_back(std::make_unique<tbb::flow::continue_node<tbb::flow::continue_msg>>(
        graph,
        [&slot](tbb::flow::continue_msg const &) { acquire(slot); }));
  }
  for (auto &node : nodes) { node->try_put(tbb::flow::continue_msg{}); }
  graph.wait_for_all();

  delivery_report report;
  for (auto &slot : slots) {
    if (!slot.failure) {
      inject_package(slot, outputs);
      if (!slot.failure && options.emit_directives) {
        tui::print_stdout("cargo:rerun-if-changed=%s\n",
                          watch_path(slot.plan.target, ctx.project_root).string().c_str());
      }
    }

    report.outcomes.push_back(package_outcome{ .name = slot.plan.name,
                                               .injected = std::move(slot.injected),
                                               .failure = slot.failure });
  }

  if (report.ok()) {
    tui::info("Delivered %zu package(s)", report.outcomes.size());
  }
  return report;
}

delivery_report deliver_or_throw(hijack_config const &config,
                                 build_context const &ctx,
                                 deliver_options const &options) {
  auto report{ deliver(config, ctx, options) };
  if (!report.ok()) { throw hijack_error(error_kind::delivery_failed, report.summary()); }
  return report;
}

}  // namespace hijack
