// core/plan.cpp - Migration plan parser
#include "plan.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <sstream>

namespace scaffix {

namespace {

enum class Section { None, Plan, Mkdir, Merge, Create, File, Remove, Prune,
                     Expect };

std::string unquote(const std::string &value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::string unescape(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c != '\\' || i + 1 == value.size()) {
      out += c;
      continue;
    }
    char n = value[++i];
    switch (n) {
    case 'n':
      out += '\n';
      break;
    case 't':
      out += '\t';
      break;
    case '\\':
      out += '\\';
      break;
    default:
      out += '\\';
      out += n;
      break;
    }
  }
  return out;
}

class PlanParser {
public:
  PlanParser(const fs::path &base_dir, std::string origin)
      : base_dir_(base_dir), origin_(std::move(origin)) {}

  MigrationPlan parse(const std::string &text) {
    std::istringstream in(text);
    std::string raw;
    while (std::getline(in, raw)) {
      ++line_no_;
      if (!raw.empty() && raw.back() == '\r')
        raw.pop_back();

      std::string line = trim(raw);
      if (line.empty() || line[0] == PLAN_COMMENT)
        continue;

      if (line.front() == '[') {
        open_section(line);
        continue;
      }

      auto eq_pos = line.find('=');
      if (eq_pos == std::string::npos) {
        fail("expected 'key = value', got '" + line + "'");
      }
      std::string key = trim(line.substr(0, eq_pos));
      // Leading whitespace of the value is dropped; quote it to keep it
      std::string value = trim(line.substr(eq_pos + 1));
      handle_key(key, value);
    }
    finish();
    return std::move(plan_);
  }

private:
  [[noreturn]] void fail(const std::string &what) const {
    throw PlanError(origin_, line_no_, what);
  }

  fs::path relative_path(const std::string &value) const {
    fs::path p = fs::path(unquote(value)).lexically_normal();
    if (p.empty() || p == ".") {
      fail("empty path");
    }
    if (p.is_absolute() || *p.begin() == "..") {
      fail("path must stay inside the project root: " + value);
    }
    return p;
  }

  std::string read_template(const std::string &value) const {
    fs::path p = fs::path(unquote(value));
    if (p.is_relative()) {
      p = base_dir_ / p;
    }
    auto text = read_text_file(p);
    if (!text) {
      fail("cannot read template: " + text.error().describe());
    }
    return text.value();
  }

  static bool parse_bool(const std::string &value, bool &out) {
    if (value == "true" || value == "yes" || value == "1") {
      out = true;
      return true;
    }
    if (value == "false" || value == "no" || value == "0") {
      out = false;
      return true;
    }
    return false;
  }

  bool bool_value(const std::string &key, const std::string &value) const {
    bool b = false;
    if (!parse_bool(value, b)) {
      fail("'" + key + "' expects true or false, got '" + value + "'");
    }
    return b;
  }

  void open_section(const std::string &line) {
    if (line.back() != ']') {
      fail("unterminated section header");
    }
    std::string inner = trim(line.substr(1, line.size() - 2));
    auto space = inner.find_first_of(" \t");
    std::string name = inner.substr(0, space);
    std::string arg =
        space == std::string::npos ? "" : trim(inner.substr(space + 1));

    finish_section();
    section_line_ = line_no_;

    if (name == "plan") {
      section_ = Section::Plan;
    } else if (name == "mkdir") {
      section_ = Section::Mkdir;
      if (!arg.empty())
        plan_.directories.push_back(relative_path(arg));
    } else if (name == "merge") {
      section_ = Section::Merge;
      plan_.merges.emplace_back();
    } else if (name == "create") {
      section_ = Section::Create;
      FileCreate create;
      create.path = relative_path(arg);
      plan_.creates.push_back(create);
      has_content_ = false;
    } else if (name == "file") {
      section_ = Section::File;
      FilePatch patch;
      patch.path = relative_path(arg);
      plan_.patches.push_back(patch);
      pending_marker_.clear();
    } else if (name == "remove") {
      section_ = Section::Remove;
      if (!arg.empty())
        plan_.removals.push_back(relative_path(arg));
    } else if (name == "prune") {
      section_ = Section::Prune;
      prune_dir_ = relative_path(arg);
      prune_rules_ = 0;
    } else if (name == "expect") {
      section_ = Section::Expect;
    } else {
      fail("unknown section [" + name + "]");
    }
  }

  void require_value(const std::string &key, const std::string &value) const {
    if (value.empty()) {
      fail("'" + key + "' needs a value");
    }
  }

  void handle_key(const std::string &key, const std::string &value) {
    switch (section_) {
    case Section::None:
      fail("'" + key + "' outside of any section");
    case Section::Plan:
      if (key == "name") {
        plan_.name = value;
        return;
      }
      break;
    case Section::Mkdir:
      if (key == "path") {
        plan_.directories.push_back(relative_path(value));
        return;
      }
      break;
    case Section::Merge:
      if (key == "source") {
        plan_.merges.back().source = relative_path(value);
        return;
      }
      if (key == "destination") {
        plan_.merges.back().destination = relative_path(value);
        return;
      }
      break;
    case Section::Create:
      if (handle_create_key(key, value))
        return;
      break;
    case Section::File:
      if (handle_file_key(key, value))
        return;
      break;
    case Section::Remove:
      if (key == "path") {
        plan_.removals.push_back(relative_path(value));
        return;
      }
      break;
    case Section::Prune:
      if (key == "name_contains") {
        require_value(key, value);
        plan_.prunes.push_back({prune_dir_, value});
        ++prune_rules_;
        return;
      }
      break;
    case Section::Expect:
      if (handle_expect_key(key, value))
        return;
      break;
    }
    fail("unknown key '" + key + "'");
  }

  bool handle_create_key(const std::string &key, const std::string &value) {
    FileCreate &create = plan_.creates.back();
    if (key == "content" || key == "from") {
      if (has_content_) {
        fail("[create] takes a single 'content' or 'from'");
      }
      create.content =
          key == "content" ? unescape(unquote(value)) : read_template(value);
      has_content_ = true;
      return true;
    }
    if (key == "replace") {
      create.replace = bool_value(key, value);
      return true;
    }
    return false;
  }

  PatchStep &last_step(StepKind kind, const std::string &key) {
    auto &steps = plan_.patches.back().steps;
    if (steps.empty() || steps.back().kind != kind) {
      fail("'" + key + "' must follow the step it modifies");
    }
    return steps.back();
  }

  // Consecutive removals of the same kind share one filter pass
  void add_pattern(StepKind kind, const std::string &value) {
    auto &steps = plan_.patches.back().steps;
    if (steps.empty() || steps.back().kind != kind) {
      PatchStep step;
      step.kind = kind;
      steps.push_back(step);
    }
    steps.back().patterns.push_back(value);
  }

  bool handle_file_key(const std::string &key, const std::string &value) {
    FilePatch &patch = plan_.patches.back();
    if (key == "create_missing") {
      patch.create_missing = bool_value(key, value);
      return true;
    }
    if (key == "indent") {
      last_step(StepKind::EnsureEntries, key).indent = unquote(value);
      return true;
    }

    require_value(key, value);
    if (key == "remove") {
      add_pattern(StepKind::RemoveLines, value);
    } else if (key == "drop_entry") {
      add_pattern(StepKind::DropEntries, value);
    } else if (key == "insert_after") {
      pending_marker_ = value;
    } else if (key == "insert" || key == "insert_from") {
      PatchStep step;
      step.kind = StepKind::Insert;
      step.marker = pending_marker_;
      step.content =
          key == "insert" ? unescape(unquote(value)) : read_template(value);
      patch.steps.push_back(step);
      pending_marker_.clear();
    } else if (key == "once") {
      last_step(StepKind::Insert, key).once = bool_value(key, value);
    } else if (key == "list") {
      PatchStep step;
      step.kind = StepKind::EnsureEntries;
      step.opener = value;
      patch.steps.push_back(step);
    } else if (key == "entry") {
      last_step(StepKind::EnsureEntries, key).entries.push_back(value);
    } else {
      return false;
    }
    return true;
  }

  // "a | b | c" split into at most n fields; the last keeps any extra '|'
  std::vector<std::string> fields(const std::string &key,
                                  const std::string &value, size_t n) const {
    std::vector<std::string> out;
    size_t start = 0;
    while (out.size() + 1 < n) {
      auto bar = value.find(PLAN_FIELD_SEPARATOR, start);
      if (bar == std::string::npos)
        break;
      out.push_back(trim(value.substr(start, bar - start)));
      start = bar + 1;
    }
    out.push_back(trim(value.substr(start)));
    if (out.size() != n) {
      fail("'" + key + "' expects " + std::to_string(n) +
           " fields separated by '|'");
    }
    for (const auto &f : out) {
      if (f.empty())
        fail("'" + key + "' has an empty field");
    }
    return out;
  }

  bool handle_expect_key(const std::string &key, const std::string &value) {
    Expectations &e = plan_.expect;
    require_value(key, value);
    if (key == "dir") {
      e.directories.push_back(relative_path(value));
    } else if (key == "file") {
      e.files.push_back(relative_path(value));
    } else if (key == "marker" || key == "absent_marker") {
      auto f = fields(key, value, 2);
      MarkerExpectation m{relative_path(f[0]), f[1]};
      (key == "marker" ? e.markers : e.absent_markers).push_back(m);
    } else if (key == "entry") {
      auto f = fields(key, value, 3);
      e.entries.push_back({relative_path(f[0]), f[1], f[2]});
    } else if (key == "absent") {
      e.absent_paths.push_back(relative_path(value));
    } else {
      return false;
    }
    return true;
  }

  // Checks that need the whole section
  void finish_section() {
    size_t saved = line_no_;
    line_no_ = section_line_;
    if (section_ == Section::Merge) {
      const TreeMove &m = plan_.merges.back();
      if (m.source.empty() || m.destination.empty()) {
        fail("[merge] needs both 'source' and 'destination'");
      }
    } else if (section_ == Section::File) {
      if (!pending_marker_.empty()) {
        fail("'insert_after' without a following 'insert'");
      }
      for (const auto &step : plan_.patches.back().steps) {
        if (step.kind == StepKind::EnsureEntries && step.entries.empty()) {
          fail("'list = " + step.opener + "' has no entries");
        }
      }
    } else if (section_ == Section::Prune && prune_rules_ == 0) {
      fail("[prune] needs at least one 'name_contains'");
    }
    line_no_ = saved;
  }

  void finish() { finish_section(); }

  fs::path base_dir_;
  std::string origin_;
  MigrationPlan plan_;
  Section section_ = Section::None;
  size_t line_no_ = 0;
  size_t section_line_ = 0;
  std::string pending_marker_;
  bool has_content_ = false;
  fs::path prune_dir_;
  size_t prune_rules_ = 0;
};

} // namespace

MigrationPlan MigrationPlan::from_string(const std::string &text,
                                         const fs::path &base_dir,
                                         const std::string &origin) {
  PlanParser parser(base_dir, origin);
  MigrationPlan plan = parser.parse(text);
  plan.origin = origin;
  return plan;
}

MigrationPlan MigrationPlan::from_file(const fs::path &path) {
  auto text = read_text_file(path);
  if (!text) {
    throw PlanError(path.string(), 0, text.error().describe());
  }
  MigrationPlan plan =
      from_string(text.value(), path.parent_path(), path.string());
  if (plan.name.empty()) {
    plan.name = path.stem().string();
  }
  LOG_DEBUG("Loaded plan '" + plan.name + "' with " +
            std::to_string(plan.action_count()) + " action(s)");
  return plan;
}

size_t MigrationPlan::action_count() const {
  return directories.size() + merges.size() + creates.size() +
         patches.size() + removals.size() + prunes.size();
}

} // namespace scaffix
