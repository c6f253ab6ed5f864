#include "breakdown_materializer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace goalgraph::breakdown {

namespace {

using collaborators::DecompositionNode;
using collaborators::DecompositionTree;

struct NodeRecord {
  const DecompositionNode* node = nullptr;
  std::string              identifier;
  model::GoalId            goal_id;
};

std::string Lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string Capitalized(const std::string& text) {
  std::string out = Lowercase(text);
  bool        word_start = true;
  for (auto& c : out) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      if (word_start) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      word_start = false;
    } else {
      word_start = true;
    }
  }
  return out;
}

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

/*
  Assigns the identifier every node is known by. Explicit external ids are
  reserved first and kept verbatim; untitled ids are slugged from the title and
  suffixed -2, -3.. until they clash with nothing reserved or assigned.
*/
class IdentifierAssigner {
 public:
  void Reserve(const DecompositionNode& node) {
    if (!IsBlank(node.external_id) && !assigned_.insert(node.external_id).second) {
      throw util::InvalidBreakdown("Duplicate external id in breakdown: " + node.external_id);
    }
    for (const auto& child : node.children) {
      Reserve(child);
    }
  }

  std::string Assign(const DecompositionNode& node) {
    if (!IsBlank(node.external_id)) {
      return node.external_id;
    }

    std::string base = Slugify(node.title);
    if (base.empty()) base = util::GenerateId();
    std::string candidate = base;
    for (int counter = 2; assigned_.count(candidate) > 0; ++counter) {
      candidate = base + "-" + std::to_string(counter);
    }
    assigned_.insert(candidate);
    return candidate;
  }

 private:
  std::set<std::string> assigned_;
};

void CollectIdentifiers(const DecompositionNode& node, IdentifierAssigner& assigner, std::vector<std::pair<const DecompositionNode*, std::string>>& out) {
  if (IsBlank(node.title)) {
    throw util::InvalidBreakdown("Breakdown node without a title");
  }
  out.emplace_back(&node, assigner.Assign(node));
  for (const auto& child : node.children) {
    CollectIdentifiers(child, assigner, out);
  }
}

// Pre-order (node, identifier) pairs; throws on duplicates and unknown references.
std::vector<std::pair<const DecompositionNode*, std::string>> ResolveIdentifiers(const DecompositionTree& tree) {
  IdentifierAssigner                                            assigner;
  std::vector<std::pair<const DecompositionNode*, std::string>> nodes;
  for (const auto& root : tree.roots) {
    assigner.Reserve(root);
  }
  for (const auto& root : tree.roots) {
    CollectIdentifiers(root, assigner, nodes);
  }

  std::set<std::string> known;
  for (const auto& [node, identifier] : nodes) {
    known.insert(identifier);
  }
  for (const auto& [node, identifier] : nodes) {
    for (const auto& reference : node->dependencies) {
      if (known.count(reference) == 0 && known.count(Slugify(reference)) == 0) {
        throw util::InvalidBreakdown("Breakdown node " + identifier + " depends on unknown id " + reference);
      }
    }
  }
  return nodes;
}

std::string FormatBody(const DecompositionNode& node) {
  std::vector<std::string> metadata;
  if (node.estimated_hours) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f", *node.estimated_hours);
    metadata.push_back(std::string("Estimate: ") + buffer + "h");
  }
  if (node.difficulty && !node.difficulty->empty()) {
    metadata.push_back("Difficulty: " + Capitalized(*node.difficulty));
  }
  if (metadata.empty()) {
    return node.description;
  }

  std::string body = node.description + "\n\n";
  for (std::size_t i = 0; i < metadata.size(); ++i) {
    if (i > 0) body += " \xE2\x80\xA2 ";
    body += metadata[i];
  }
  return body;
}

// Root positions: recommended rank first, tree order for ties and unranked roots.
std::vector<std::size_t> RootOrder(const DecompositionTree& tree) {
  std::unordered_map<std::string, std::size_t> rank;
  for (std::size_t i = 0; i < tree.recommended_order.size(); ++i) {
    rank.emplace(tree.recommended_order[i], i);
  }

  const auto rank_of = [&](std::size_t index) {
    const auto& node = tree.roots[index];
    auto        it   = rank.find(node.external_id);
    if (it == rank.end()) it = rank.find(Slugify(node.title));
    return it == rank.end() ? tree.recommended_order.size() : it->second;
  };

  std::vector<std::size_t> order(tree.roots.size());
  for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) { return rank_of(lhs) < rank_of(rhs); });

  std::vector<std::size_t> position(tree.roots.size());
  for (std::size_t i = 0; i < order.size(); ++i) position[order[i]] = i;
  return position;
}

model::Goal MakeGoal(const DecompositionNode& node, const model::Goal& target, model::TimePoint now) {
  model::Goal goal;
  goal.id                   = util::GenerateId();
  goal.created_at           = now;
  goal.updated_at           = now;
  goal.title                = node.title;
  goal.body                 = FormatBody(node);
  goal.category             = target.category;
  goal.priority             = node.priority.value_or(PriorityForDifficulty(node.difficulty));
  goal.kind                 = target.kind;
  goal.is_atomic            = node.is_atomic || node.children.empty();
  goal.has_been_broken_down = !node.children.empty();
  return goal;
}

class TreeWriter {
 public:
  TreeWriter(graph::GoalGraph& graph, const model::Goal& target, model::TimePoint now, BreakdownResult& result)
      : graph_(graph), target_(target), now_(now), result_(result) {
  }

  void Write(const DecompositionNode& node, const model::GoalId& parent, std::optional<std::int64_t> sort_index,
             const std::unordered_map<const DecompositionNode*, std::string>& identifiers, std::vector<NodeRecord>& records) {
    auto goal = MakeGoal(node, target_, now_);
    if (goal.is_atomic) ++result_.atomic_task_count;

    const auto& inserted = sort_index ? graph_.InsertAt(std::move(goal), parent, *sort_index) : graph_.Insert(std::move(goal), parent);
    const auto  id       = inserted.id;

    const auto& identifier = identifiers.at(&node);
    result_.created_goals.push_back(id);
    result_.assigned_identifiers.emplace(identifier, id);
    records.push_back(NodeRecord{&node, identifier, id});

    for (const auto& child : node.children) {
      Write(child, id, std::nullopt, identifiers, records);
    }
  }

 private:
  graph::GoalGraph&  graph_;
  const model::Goal& target_;
  model::TimePoint   now_;
  BreakdownResult&   result_;
};

void LogDroppedEdge(const std::string& prerequisite, const std::string& dependent, const std::string& reason) {
  GOALGRAPH_LOG_WARN("Dropped breakdown dependency",
                     {observability::StringField("prerequisite", prerequisite), observability::StringField("dependent", dependent),
                      observability::StringField("reason", reason)});
}

std::size_t ResolveDependencies(graph::GoalGraph& graph, const std::vector<NodeRecord>& records, const std::map<std::string, model::GoalId>& index,
                                model::TimePoint now) {
  std::size_t created = 0;
  for (const auto& record : records) {
    for (const auto& reference : record.node->dependencies) {
      auto it = index.find(reference);
      if (it == index.end()) it = index.find(Slugify(reference));
      if (it == index.end()) continue; // rejected by validation

      const auto& prerequisite = it->second;
      try {
        graph.AddDependency(prerequisite, record.goal_id, model::DependencyKind::kFinishToStart, std::nullopt, now);
        ++created;
      } catch (const util::SelfDependencyError&) {
        LogDroppedEdge(reference, record.identifier, "self dependency");
      } catch (const util::AlreadyExists&) {
        LogDroppedEdge(reference, record.identifier, "duplicate");
      } catch (const util::CycleError&) {
        LogDroppedEdge(reference, record.identifier, "cycle");
      }
    }
  }
  return created;
}

} // namespace

std::string Slugify(const std::string& raw) {
  std::string slug;
  bool        pending_dash = false;
  for (unsigned char c : raw) {
    if (std::isalnum(c) || c >= 0x80) {
      if (pending_dash && !slug.empty()) slug.push_back('-');
      pending_dash = false;
      slug.push_back(static_cast<char>(std::tolower(c)));
    } else {
      pending_dash = true;
    }
  }
  return slug;
}

model::Priority PriorityForDifficulty(const std::optional<std::string>& difficulty) {
  if (!difficulty) return model::Priority::kLater;
  const auto normalized = Lowercase(*difficulty);
  if (normalized == "hard") return model::Priority::kNow;
  if (normalized == "medium") return model::Priority::kNext;
  return model::Priority::kLater;
}

void Validate(const DecompositionTree& tree) {
  (void)ResolveIdentifiers(tree);
}

BreakdownResult Apply(graph::GoalGraph& graph, const model::GoalId& target_id, const DecompositionTree& tree, model::TimePoint now) {
  // Everything that can reject runs before the first insert.
  const auto  nodes  = ResolveIdentifiers(tree);
  const auto& target = graph.Get(target_id);
  if (target.step_of) {
    throw util::InvalidState("Roadmap steps cannot be broken down: " + target_id);
  }

  std::unordered_map<const DecompositionNode*, std::string> identifiers;
  for (const auto& [node, identifier] : nodes) {
    identifiers.emplace(node, identifier);
  }

  BreakdownResult         result;
  std::vector<NodeRecord> records;
  const auto              positions = RootOrder(tree);

  {
    const model::Goal parent_copy = target;
    TreeWriter        writer(graph, parent_copy, now, result);
    for (std::size_t i = 0; i < tree.roots.size(); ++i) {
      writer.Write(tree.roots[i], target_id, static_cast<std::int64_t>(positions[i]), identifiers, records);
    }
  }

  result.dependency_count = ResolveDependencies(graph, records, result.assigned_identifiers, now);

  auto& parent = graph.Mutable(target_id);
  if (!parent.has_been_broken_down) {
    parent.has_been_broken_down = true;
    model::AppendRevision(parent, "Broken down",
                          "Created " + std::to_string(result.created_goals.size()) + " subgoals and " +
                              std::to_string(result.dependency_count) + " dependencies",
                          now);
  }

  GOALGRAPH_LOG_INFO("Breakdown applied", {observability::StringField("goal_id", target_id),
                                           observability::IntField("created", static_cast<std::int64_t>(result.created_goals.size())),
                                           observability::IntField("atomic", static_cast<std::int64_t>(result.atomic_task_count)),
                                           observability::IntField("dependencies", static_cast<std::int64_t>(result.dependency_count))});
  return result;
}

} // namespace goalgraph::breakdown
