// Generates the handler category X-macro and metadata tables from
// configs/handler/categories.yml.
//
//   gen_categories <categories.yml> <output_dir>
//
// Writes <output_dir>/category.def and <output_dir>/category_tables.h.

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct CategorySpec {
  std::string id;
  std::string key;
  std::string display_name;
  std::string description;
};

struct CategorySet {
  std::vector<CategorySpec> categories;
  std::size_t default_index{0};
};

/// Collects every problem in the file so one run reports all of them.
class Problems {
public:
  void add(std::string where, std::string what) {
    messages_.push_back(std::move(where) + ": " + std::move(what));
  }

  [[nodiscard]] bool empty() const noexcept { return messages_.empty(); }

  void print(std::ostream &out, const fs::path &file) const {
    for (const auto &message : messages_) {
      out << file.string() << ": " << message << "\n";
    }
  }

private:
  std::vector<std::string> messages_;
};

bool isIdentifier(std::string_view text) {
  if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front()))) {
    return false;
  }
  for (const char ch : text) {
    if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_') {
      return false;
    }
  }
  return true;
}

std::string lowercase(std::string_view text) {
  std::string out(text);
  for (char &ch : out) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return out;
}

bool isLowercaseKey(std::string_view text) {
  return !text.empty() && lowercase(text) == text &&
         text.find_first_of(" \t\"\\") == std::string_view::npos;
}

std::string scalarOr(const YAML::Node &node, const char *field, std::string fallback,
                     const std::string &where, Problems &problems) {
  const YAML::Node value = node[field];
  if (!value) {
    return fallback;
  }
  if (!value.IsScalar()) {
    problems.add(where, std::string("'") + field + "' must be a string");
    return fallback;
  }
  return value.as<std::string>();
}

/// `key` defaults to the lowercased id and `display_name` to the id.
CategorySpec readCategory(const YAML::Node &node, const std::string &where, Problems &problems) {
  CategorySpec spec;
  if (!node.IsMap()) {
    problems.add(where, "expected a mapping");
    return spec;
  }
  static const std::set<std::string> kFields{"id", "key", "display_name", "description"};
  for (const auto &field : node) {
    const std::string name = field.first.Scalar();
    if (kFields.count(name) == 0) {
      problems.add(where, "unknown field '" + name + "'");
    }
  }

  spec.id = scalarOr(node, "id", "", where, problems);
  if (!isIdentifier(spec.id)) {
    problems.add(where, "id '" + spec.id + "' is not a C++ identifier");
  }
  spec.key = scalarOr(node, "key", lowercase(spec.id), where, problems);
  if (!isLowercaseKey(spec.key)) {
    problems.add(where, "key '" + spec.key + "' must be a lowercase word");
  }
  spec.display_name = scalarOr(node, "display_name", spec.id, where, problems);
  spec.description = scalarOr(node, "description", "", where, problems);
  return spec;
}

CategorySet loadCategories(const fs::path &file, Problems &problems) {
  CategorySet set;
  YAML::Node root;
  try {
    root = YAML::LoadFile(file.string());
  } catch (const YAML::Exception &e) {
    problems.add("document", e.what());
    return set;
  }

  const YAML::Node list = root["categories"];
  if (!list || !list.IsSequence() || list.size() == 0) {
    problems.add("categories", "expected a non-empty sequence");
    return set;
  }

  std::set<std::string> ids;
  std::set<std::string> keys;
  for (std::size_t i = 0; i < list.size(); ++i) {
    const std::string where = "categories[" + std::to_string(i) + "]";
    CategorySpec spec = readCategory(list[i], where, problems);
    if (!spec.id.empty() && !ids.insert(spec.id).second) {
      problems.add(where, "id '" + spec.id + "' is declared twice");
    }
    if (!spec.key.empty() && !keys.insert(spec.key).second) {
      problems.add(where, "key '" + spec.key + "' is declared twice");
    }
    set.categories.push_back(std::move(spec));
  }

  const YAML::Node fallback = root["default"];
  if (!fallback || !fallback.IsScalar()) {
    problems.add("default", "expected the key of the default category");
    return set;
  }
  const std::string wanted = fallback.Scalar();
  for (std::size_t i = 0; i < set.categories.size(); ++i) {
    if (set.categories[i].key == wanted) {
      set.default_index = i;
      return set;
    }
  }
  problems.add("default", "'" + wanted + "' is not a declared category key");
  return set;
}

std::string quoted(std::string_view text) {
  std::string out = "\"";
  for (const char ch : text) {
    if (ch == '"' || ch == '\\') {
      out += '\\';
    }
    out += ch == '\n' ? ' ' : ch;
  }
  out += '"';
  return out;
}

std::string renderDef(const CategorySet &set) {
  std::ostringstream out;
  out << "// Generated by gen_categories. Do not edit.\n";
  for (const auto &spec : set.categories) {
    out << "HANDLER_CATEGORY(" << spec.id << ", " << quoted(spec.key) << ", "
        << quoted(spec.display_name) << ", " << quoted(spec.description) << ")\n";
  }
  return out.str();
}

std::string renderTables(const CategorySet &set) {
  std::ostringstream out;
  out << "// Generated by gen_categories. Do not edit.\n"
      << "#pragma once\n\n"
      << "#include <array>\n#include <cstddef>\n#include <string_view>\n\n"
      << "namespace switchyard::generated::category_tables {\n\n"
      << "inline constexpr std::size_t kCategoryCount = " << set.categories.size() << ";\n"
      << "inline constexpr std::size_t kDefaultCategoryIndex = " << set.default_index << ";\n";

  const auto column = [&](const char *name, std::string CategorySpec::*field) {
    out << "\ninline constexpr std::array<std::string_view, kCategoryCount> " << name << "{\n";
    for (const auto &spec : set.categories) {
      out << "    " << quoted(spec.*field) << ",\n";
    }
    out << "};\n";
  };
  column("kCategoryKeys", &CategorySpec::key);
  column("kCategoryDisplayNames", &CategorySpec::display_name);
  column("kCategoryDescriptions", &CategorySpec::description);

  out << "\n} // namespace switchyard::generated::category_tables\n";
  return out.str();
}

/// @return false if the file could not be written.
bool writeFile(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  return static_cast<bool>(out);
}

} // namespace

int main(int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "usage: gen_categories <categories.yml> <output_dir>\n";
    return 2;
  }
  const fs::path input = argv[1];
  const fs::path output_dir = argv[2];

  Problems problems;
  const CategorySet set = loadCategories(input, problems);
  if (!problems.empty()) {
    problems.print(std::cerr, input);
    return 1;
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    std::cerr << "gen_categories: cannot create " << output_dir.string() << ": " << ec.message()
              << "\n";
    return 1;
  }
  for (const auto &[name, content] :
       {std::pair<const char *, std::string>{"category.def", renderDef(set)},
        std::pair<const char *, std::string>{"category_tables.h", renderTables(set)}}) {
    if (!writeFile(output_dir / name, content)) {
      std::cerr << "gen_categories: cannot write " << (output_dir / name).string() << "\n";
      return 1;
    }
  }
  return 0;
}
