#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "internal/collaborators/offline.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using goalgraph::core::GoalManager;
using goalgraph::model::Goal;

static void Usage() {
  std::cout << "Usage:\n"
            << "  goalgraph --config <config.yaml> list\n"
            << "  goalgraph --config <config.yaml> show <id>\n"
            << "  goalgraph --config <config.yaml> create <title> [parent-id]\n"
            << "  goalgraph --config <config.yaml> timeline <id> <days>\n"
            << "  goalgraph --config <config.yaml> lock <id>\n"
            << "  goalgraph --config <config.yaml> unlock <id> <reason>\n"
            << "  goalgraph --config <config.yaml> complete <id>\n"
            << "  goalgraph --config <config.yaml> archive <id> <reason>\n"
            << "  goalgraph --config <config.yaml> delete <id>\n";
}

static std::string Percent(double progress) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(0) << progress * 100.0 << "%";
  return out.str();
}

static void PrintTree(const GoalManager& manager, const Goal& goal, int depth) {
  std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ') << goal.id << "  [" << goalgraph::model::ToString(goal.state)
            << (goal.is_locked ? ", locked" : "") << "]  " << Percent(manager.Progress(goal.id)) << "  " << goal.title << "\n";
  for (const auto& child : manager.Children(goal.id)) {
    PrintTree(manager, child, depth + 1);
  }
}

static void PrintGoal(const GoalManager& manager, const Goal& goal) {
  std::cout << "id:        " << goal.id << "\n"
            << "title:     " << goal.title << "\n"
            << "category:  " << goal.category << "\n"
            << "priority:  " << goalgraph::model::ToString(goal.priority) << "\n"
            << "kind:      " << goalgraph::model::ToString(goal.kind) << "\n"
            << "state:     " << goalgraph::model::ToString(goal.state) << (goal.is_locked ? " (locked)" : "") << "\n"
            << "progress:  " << Percent(manager.Progress(goal.id)) << "\n";
  if (goal.parent_id) std::cout << "parent:    " << *goal.parent_id << "\n";
  if (!goal.body.empty()) std::cout << "\n" << goal.body << "\n";

  const auto steps = manager.Steps(goal.id);
  if (!steps.empty()) {
    std::cout << "\nroadmap:\n";
    for (std::size_t i = 0; i < steps.size(); ++i) {
      std::cout << "  " << i + 1 << ". [" << goalgraph::model::ToString(steps[i].step_status) << "] " << steps[i].title
                << (steps[i].is_final_step ? " (final)" : "") << "\n";
    }
  }

  for (const auto& edge : manager.IncomingDependencies(goal.id)) {
    std::cout << "depends on: " << edge.prerequisite << " (" << goalgraph::model::ToString(edge.kind) << ")\n";
  }

  std::cout << "\nrevisions:\n";
  for (const auto& revision : manager.RevisionHistory(goal.id)) {
    std::cout << "  " << goalgraph::util::FormatUtc(revision.recorded_at) << "  " << revision.summary;
    if (revision.rationale) std::cout << " (" << *revision.rationale << ")";
    std::cout << "\n";
  }
}

static const char* KindName(goalgraph::timeline::EntryKind kind) {
  switch (kind) {
    case goalgraph::timeline::EntryKind::kEvent:
      return "event";
    case goalgraph::timeline::EntryKind::kProjection:
      return "projection";
    case goalgraph::timeline::EntryKind::kPhase:
      return "phase";
    case goalgraph::timeline::EntryKind::kMetricCheckpoint:
      return "checkpoint";
  }
  return "unknown";
}

static int Run(GoalManager& manager, const std::string& cmd, int argc, char** argv) {
  // argv[3] onwards are command arguments
  const auto arg = [&](int index) -> std::string { return argv[3 + index]; };
  const int  nargs = argc - 4;

  if (cmd == "list") {
    for (const auto& goal : manager.TopLevelGoals()) {
      PrintTree(manager, goal, 0);
    }
    return 0;
  }

  if (cmd == "show") {
    if (nargs < 1) return 1;
    PrintGoal(manager, manager.Get(arg(1)));
    return 0;
  }

  if (cmd == "create") {
    if (nargs < 1) return 1;
    goalgraph::core::NewGoal draft;
    draft.title = arg(1);
    std::optional<std::string> parent;
    if (nargs >= 2) parent = arg(2);
    const auto goal = manager.CreateGoal(draft, parent);
    manager.Save();
    std::cout << goal.id << "\n";
    return 0;
  }

  if (cmd == "timeline") {
    if (nargs < 2) return 1;
    const auto days = std::stoll(arg(2));
    if (days <= 0) {
      std::cerr << "days must be positive\n";
      return 1;
    }
    goalgraph::timeline::Horizon horizon;
    horizon.start = goalgraph::util::Now();
    horizon.end   = goalgraph::util::AddDays(horizon.start, days);

    const auto entries = manager.TimelineEntries(arg(1), horizon);
    if (entries.empty()) {
      std::cout << (manager.IsInHorizon(arg(1), horizon) ? "no entries (goal spans this horizon)\n" : "no entries\n");
      return 0;
    }
    for (const auto& entry : entries) {
      std::cout << goalgraph::util::FormatUtc(entry.start) << "  " << std::left << std::setw(11) << KindName(entry.kind) << entry.title;
      if (entry.metric_summary) std::cout << "  " << *entry.metric_summary;
      if (entry.confidence) std::cout << "  (" << Percent(*entry.confidence) << ")";
      std::cout << "\n";
    }
    return 0;
  }

  if (cmd == "lock") {
    if (nargs < 1) return 1;
    const auto snapshot = manager.Lock(arg(1));
    manager.Save();
    std::cout << "locked: " << snapshot.rationale << "\n";
    return 0;
  }

  if (cmd == "unlock") {
    if (nargs < 2) return 1;
    const bool changed = manager.Unlock(arg(1), arg(2));
    manager.Save();
    std::cout << (changed ? "unlocked\n" : "not locked\n");
    return 0;
  }

  if (cmd == "complete") {
    if (nargs < 1) return 1;
    manager.Complete(arg(1));
    manager.Save();
    std::cout << "completed\n";
    return 0;
  }

  if (cmd == "archive") {
    if (nargs < 2) return 1;
    manager.Deactivate(arg(1), goalgraph::model::ActivationState::kArchived, arg(2));
    manager.Save();
    std::cout << "archived\n";
    return 0;
  }

  if (cmd == "delete") {
    if (nargs < 1) return 1;
    const auto removed = manager.Delete(arg(1));
    manager.Save();
    std::cout << "deleted " << removed.size() << " goals\n";
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    auto config = goalgraph::config::ConfigLoader::LoadFromYaml(config_path);
    goalgraph::observability::InitializeLogging(config);

    auto app = goalgraph::factory::Build(config, std::make_shared<goalgraph::collaborators::OfflineReasoningService>(),
                                         std::make_shared<goalgraph::collaborators::OfflineCalendarService>());

    const int rc = Run(*app.manager, cmd, argc, argv);
    if (rc == 1) Usage();
    goalgraph::observability::ShutdownLogging();
    return rc;
  } catch (const goalgraph::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
  } catch (const goalgraph::util::LockedError& e) {
    std::cerr << "locked: " << e.what() << "\n";
  } catch (const std::exception& e) {
    GOALGRAPH_LOG_ERROR("Fatal error", {goalgraph::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
  }
  goalgraph::observability::ShutdownLogging();
  return 2;
}
