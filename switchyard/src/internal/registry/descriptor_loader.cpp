#include "switchyard/internal/registry/descriptor_loader.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>

#include "switchyard/internal/diagnostics/error/error.h"
#include "switchyard/internal/diagnostics/log/log.h"
#include "switchyard/internal/router/text_normalizer.h"

namespace switchyard::internal::registry {

namespace fs = std::filesystem;
namespace diag = ::switchyard::internal::diagnostics::error;

namespace {

constexpr std::size_t kMaxDescriptionLength = 200;

[[noreturn]] void fail(std::string_view context, const std::string &message) {
  std::ostringstream oss;
  oss << context << ": " << message;
  diag::throwError(diag::SwitchyardErrc::MalformedDescriptor, oss.str());
}

void expectKeys(const YAML::Node &node, std::string_view context,
                std::initializer_list<std::string_view> allowed) {
  std::unordered_set<std::string_view> allowed_set(allowed.begin(), allowed.end());
  for (const auto &kv : node) {
    if (!kv.first.IsScalar()) {
      fail(context, "non-scalar key");
    }
    const std::string key = kv.first.as<std::string>();
    if (!allowed_set.count(key)) {
      fail(context, "unknown key '" + key + "'");
    }
  }
}

std::string readRequiredString(const YAML::Node &node, const std::string &key,
                               std::string_view context) {
  const auto value = node[key];
  if (!value) {
    fail(context, "missing required key '" + key + "'");
  }
  if (!value.IsScalar()) {
    fail(context, "key '" + key + "' must be a scalar");
  }
  std::string result = value.as<std::string>();
  if (result.empty()) {
    fail(context, "key '" + key + "' must not be empty");
  }
  return result;
}

std::optional<std::string> readOptionalString(const YAML::Node &node, const std::string &key,
                                              std::string_view context) {
  const auto value = node[key];
  if (!value || value.IsNull()) {
    return std::nullopt;
  }
  if (!value.IsScalar()) {
    fail(context, "key '" + key + "' must be a scalar");
  }
  return value.as<std::string>();
}

std::string trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

/// Sequence of scalars, or a single comma-separated scalar.
std::optional<std::vector<std::string>> readStringList(const YAML::Node &node,
                                                       const std::string &key,
                                                       std::string_view context) {
  const auto value = node[key];
  if (!value || value.IsNull()) {
    return std::nullopt;
  }
  std::vector<std::string> items;
  if (value.IsSequence()) {
    for (std::size_t i = 0; i < value.size(); ++i) {
      if (!value[i].IsScalar()) {
        fail(context, "entries of '" + key + "' must be scalars");
      }
      items.push_back(trim(value[i].as<std::string>()));
    }
  } else if (value.IsScalar()) {
    std::string_view text = value.Scalar();
    while (!text.empty()) {
      const auto comma = text.find(',');
      items.push_back(trim(text.substr(0, comma)));
      if (comma == std::string_view::npos) {
        break;
      }
      text.remove_prefix(comma + 1);
    }
  } else {
    fail(context, "key '" + key + "' must be a list");
  }
  return items;
}

std::vector<std::string> requireKeywords(std::optional<std::vector<std::string>> keywords,
                                         std::string_view key, std::string_view context) {
  if (!keywords) {
    fail(context, "missing required key '" + std::string(key) + "'");
  }
  if (keywords->empty()) {
    fail(context, "'" + std::string(key) + "' must not be empty");
  }
  for (const auto &keyword : *keywords) {
    if (router::normalize(keyword).empty()) {
      fail(context, "keyword '" + keyword + "' has no matchable characters");
    }
  }
  return std::move(*keywords);
}

int parsePriority(const YAML::Node &node, std::string_view context) {
  const auto value = node["priority"];
  if (!value || value.IsNull()) {
    return handler::kDefaultPriority;
  }
  if (!value.IsScalar()) {
    fail(context, "key 'priority' must be a scalar");
  }
  static const std::map<std::string, int, std::less<>> kNamed = {
      {"critical", 10}, {"high", 30}, {"normal", 50}, {"low", 70}};
  std::string text = value.as<std::string>();
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (const auto it = kNamed.find(text); it != kNamed.end()) {
    return it->second;
  }
  int parsed = 0;
  if (!YAML::convert<int>::decode(value, parsed)) {
    fail(context, "priority '" + value.as<std::string>() + "' is not an integer");
  }
  return parsed;
}

void applyOptionalFields(const YAML::Node &node, std::string_view context,
                         handler::HandlerDescriptor &descriptor) {
  if (const auto category = readOptionalString(node, "category", context)) {
    const auto parsed = handler::parseCategory(trim(*category));
    if (!parsed) {
      fail(context, "unknown category '" + *category + "'");
    }
    descriptor.category = *parsed;
  }
  descriptor.priority = parsePriority(node, context);
  if (auto tags = readStringList(node, "tags", context)) {
    for (auto &tag : *tags) {
      if (!tag.empty()) {
        descriptor.tags.insert(std::move(tag));
      }
    }
  }
  if (auto description = readOptionalString(node, "description", context)) {
    descriptor.description = std::move(*description);
  }
  if (const auto mode = readOptionalString(node, "execution_mode", context)) {
    const auto parsed = handler::parseExecutionMode(trim(*mode));
    if (!parsed) {
      fail(context, "unknown execution_mode '" + *mode + "'");
    }
    descriptor.execution_mode = *parsed;
  }
}

handler::HandlerDescriptor parseHandlerNode(const YAML::Node &node, const std::string &context,
                                            std::string_view origin) {
  if (!node.IsMap()) {
    fail(context, "handler entry must be a mapping");
  }
  expectKeys(node, context,
             {"name", "category", "trigger_keywords", "priority", "tags", "description",
              "execution_mode"});

  handler::HandlerDescriptor descriptor;
  descriptor.name = trim(readRequiredString(node, "name", context));
  if (descriptor.name.empty()) {
    fail(context, "key 'name' must not be empty");
  }
  const std::string named_context = context + " ('" + descriptor.name + "')";
  descriptor.trigger_keywords = requireKeywords(
      readStringList(node, "trigger_keywords", named_context), "trigger_keywords", named_context);
  applyOptionalFields(node, named_context, descriptor);
  descriptor.source = std::string(origin);
  return descriptor;
}

handler::WorkflowRule parseWorkflowNode(const YAML::Node &node, const std::string &context) {
  if (!node.IsMap()) {
    fail(context, "workflow entry must be a mapping");
  }
  expectKeys(node, context, {"name", "trigger_keywords", "handlers"});

  handler::WorkflowRule rule;
  rule.name = trim(readRequiredString(node, "name", context));
  rule.trigger_keywords = requireKeywords(readStringList(node, "trigger_keywords", context),
                                          "trigger_keywords", context);
  auto handlers = readStringList(node, "handlers", context);
  if (!handlers || handlers->empty()) {
    fail(context, "'handlers' must not be empty");
  }
  rule.handlers = std::move(*handlers);
  return rule;
}

std::string readFile(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    fail(path.string(), "cannot open file");
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  return oss.str();
}

bool isSupportedFile(const fs::path &path) {
  const auto ext = path.extension().string();
  return ext == ".yml" || ext == ".yaml" || ext == ".md";
}

std::string upperStem(const fs::path &path) {
  std::string stem = path.stem().string();
  std::transform(stem.begin(), stem.end(), stem.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return stem;
}

void appendCatalog(DescriptorCatalog &into, DescriptorCatalog &&from) {
  for (auto &descriptor : from.descriptors) {
    into.descriptors.push_back(std::move(descriptor));
  }
  for (auto &workflow : from.workflows) {
    into.workflows.push_back(std::move(workflow));
  }
}

DescriptorCatalog loadFile(const fs::path &path) {
  const std::string origin = path.string();
  const std::string text = readFile(path);
  if (path.extension() == ".md") {
    DescriptorCatalog catalog;
    catalog.descriptors.push_back(parseMarkdownDescriptor(text, origin, upperStem(path)));
    return catalog;
  }
  if (path.extension() == ".yml" || path.extension() == ".yaml") {
    return parseYamlDescriptors(text, origin);
  }
  fail(origin, "unsupported descriptor file extension");
}

DescriptorCatalog loadSource(const DescriptorSource &source) {
  switch (source.kind) {
  case DescriptorSource::Kind::Text:
    return parseYamlDescriptors(source.text, source.location);
  case DescriptorSource::Kind::File:
    return loadFile(fs::path(source.location));
  case DescriptorSource::Kind::Directory: {
    std::error_code ec;
    const fs::path root(source.location);
    if (!fs::is_directory(root, ec)) {
      fail(source.location, "not a directory");
    }
    std::vector<fs::path> files;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
      if (it->is_regular_file() && isSupportedFile(it->path())) {
        files.push_back(it->path());
      }
    }
    if (ec) {
      fail(source.location, "cannot list directory: " + ec.message());
    }
    std::sort(files.begin(), files.end());
    DescriptorCatalog catalog;
    for (const auto &file : files) {
      appendCatalog(catalog, loadFile(file));
    }
    return catalog;
  }
  }
  fail(source.location, "unknown source kind");
}

void validateBatch(const DescriptorCatalog &catalog) {
  std::map<std::string, const handler::HandlerDescriptor *, std::less<>> by_name;
  for (const auto &descriptor : catalog.descriptors) {
    const auto [it, inserted] = by_name.emplace(descriptor.name, &descriptor);
    if (!inserted) {
      fail(descriptor.source, "duplicate handler name '" + descriptor.name +
                                  "' (first declared in " + it->second->source + ")");
    }
  }
  std::set<std::string, std::less<>> workflow_names;
  for (const auto &workflow : catalog.workflows) {
    const std::string context = "workflow '" + workflow.name + "'";
    if (!workflow_names.insert(workflow.name).second) {
      fail(context, "duplicate workflow name");
    }
    for (const auto &member : workflow.handlers) {
      if (by_name.find(member) == by_name.end()) {
        fail(context, "unknown handler '" + member + "'");
      }
    }
  }
}

} // namespace

DescriptorSource DescriptorSource::file(std::string path) {
  return DescriptorSource{Kind::File, std::move(path), {}};
}

DescriptorSource DescriptorSource::directory(std::string path) {
  return DescriptorSource{Kind::Directory, std::move(path), {}};
}

DescriptorSource DescriptorSource::inlineYaml(std::string label, std::string yaml) {
  return DescriptorSource{Kind::Text, std::move(label), std::move(yaml)};
}

DescriptorCatalog parseYamlDescriptors(std::string_view text, std::string_view origin) {
  const std::string origin_str(origin);
  YAML::Node document;
  try {
    document = YAML::Load(std::string(text));
  } catch (const YAML::Exception &e) {
    fail(origin_str, std::string("invalid YAML: ") + e.what());
  }
  const YAML::Node root = document;

  DescriptorCatalog catalog;
  try {
    if (!root || !root.IsMap()) {
      fail(origin_str, "document root must be a mapping");
    }

    if (!root["handlers"] && !root["workflows"]) {
      catalog.descriptors.push_back(parseHandlerNode(root, origin_str, origin));
      return catalog;
    }

    expectKeys(root, origin_str, {"schema_version", "handlers", "workflows"});
    const auto handlers = root["handlers"];
    if (handlers) {
      if (!handlers.IsSequence()) {
        fail(origin_str, "'handlers' must be a sequence");
      }
      for (std::size_t index = 0; index < handlers.size(); ++index) {
        const std::string context = origin_str + " handlers[" + std::to_string(index) + "]";
        catalog.descriptors.push_back(parseHandlerNode(handlers[index], context, origin));
      }
    }
    const auto workflows = root["workflows"];
    if (workflows) {
      if (!workflows.IsSequence()) {
        fail(origin_str, "'workflows' must be a sequence");
      }
      for (std::size_t index = 0; index < workflows.size(); ++index) {
        const std::string context = origin_str + " workflows[" + std::to_string(index) + "]";
        catalog.workflows.push_back(parseWorkflowNode(workflows[index], context));
      }
    }
  } catch (const YAML::Exception &e) {
    fail(origin_str, std::string("invalid value: ") + e.what());
  }
  return catalog;
}

handler::HandlerDescriptor parseMarkdownDescriptor(std::string_view text,
                                                   std::string_view origin,
                                                   std::string_view fallback_name) {
  const std::string origin_str(origin);
  if (text.substr(0, 3) != "---") {
    fail(origin_str, "markdown descriptor has no front matter");
  }
  const auto close = text.find("\n---", 3);
  if (close == std::string_view::npos) {
    fail(origin_str, "front matter is not terminated");
  }
  const std::string_view front = text.substr(3, close - 3);
  std::string_view body = text.substr(close + 4);
  if (const auto eol = body.find('\n'); eol != std::string_view::npos) {
    body.remove_prefix(eol + 1);
  } else {
    body = {};
  }

  YAML::Node document;
  try {
    document = YAML::Load(std::string(front));
  } catch (const YAML::Exception &e) {
    fail(origin_str, std::string("invalid front matter: ") + e.what());
  }
  const YAML::Node root = document;

  handler::HandlerDescriptor descriptor;
  try {
    if (!root || !root.IsMap()) {
      fail(origin_str, "front matter must be a mapping");
    }
    const auto name = readOptionalString(root, "name", origin_str);
    descriptor.name = trim(name ? *name : std::string(fallback_name));
    if (descriptor.name.empty()) {
      fail(origin_str, "missing required key 'name'");
    }
    const std::string context = origin_str + " ('" + descriptor.name + "')";
    if (root["trigger_keywords"]) {
      descriptor.trigger_keywords = requireKeywords(
          readStringList(root, "trigger_keywords", context), "trigger_keywords", context);
    } else {
      descriptor.trigger_keywords = requireKeywords(
          readStringList(root, "proactive_triggers", context), "trigger_keywords", context);
    }
    applyOptionalFields(root, context, descriptor);
  } catch (const YAML::Exception &e) {
    fail(origin_str, std::string("invalid value: ") + e.what());
  }

  if (descriptor.description.empty()) {
    while (!body.empty()) {
      const auto eol = body.find('\n');
      const std::string line = trim(body.substr(0, eol));
      if (!line.empty() && line.front() != '#') {
        descriptor.description = line.substr(0, kMaxDescriptionLength);
        break;
      }
      if (eol == std::string_view::npos) {
        break;
      }
      body.remove_prefix(eol + 1);
    }
  }
  descriptor.source = origin_str;
  return descriptor;
}

DescriptorCatalog loadDescriptors(const std::vector<DescriptorSource> &sources) {
  DescriptorCatalog catalog;
  for (const auto &source : sources) {
    appendCatalog(catalog, loadSource(source));
  }
  validateBatch(catalog);
  SWITCHYARD_LOG_DEBUG(Registry, "loaded " + std::to_string(catalog.descriptors.size()) +
                                     " descriptors and " +
                                     std::to_string(catalog.workflows.size()) +
                                     " workflows from " + std::to_string(sources.size()) +
                                     " sources");
  return catalog;
}

} // namespace switchyard::internal::registry
