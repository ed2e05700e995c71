#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/internal/handler/handler_descriptor.h"

namespace switchyard::internal::registry {

/**
 * @brief Where a batch of descriptors comes from.
 */
struct DescriptorSource {
  enum class Kind : std::uint8_t {
    File,      ///< `.yml`/`.yaml` handler file or `.md` agent file
    Directory, ///< Every supported file directly inside, sorted by path
    Text,      ///< In-memory YAML document
  };

  Kind kind{Kind::File};
  /// Path for File/Directory, label for Text.
  std::string location;
  /// Document body for Kind::Text.
  std::string text;

  static DescriptorSource file(std::string path);
  static DescriptorSource directory(std::string path);
  static DescriptorSource inlineYaml(std::string label, std::string yaml);
};

/**
 * @brief Everything one load produced.
 */
struct DescriptorCatalog {
  std::vector<handler::HandlerDescriptor> descriptors;
  std::vector<handler::WorkflowRule> workflows;
};

/**
 * @brief Load and validate all sources as one batch.
 *
 * The batch is all-or-nothing: the first problem aborts the load.
 *
 * @throws SwitchyardException MalformedDescriptor naming the offending source
 *         and record when a `name` or `trigger_keywords` entry is missing or
 *         empty, a value has the wrong type, a name repeats within the batch,
 *         a workflow names an unknown handler, or a source cannot be read.
 */
DescriptorCatalog loadDescriptors(const std::vector<DescriptorSource> &sources);

/**
 * @brief Parse one YAML document.
 *
 * Accepts either a mapping with `handlers:` (and optional `workflows:`) or a
 * single handler mapping.
 */
DescriptorCatalog parseYamlDescriptors(std::string_view text, std::string_view origin);

/**
 * @brief Parse one markdown agent file with YAML front matter.
 *
 * `name` defaults to `fallback_name` (the upper-cased file stem),
 * `proactive_triggers` is accepted for `trigger_keywords`, and a missing
 * `description` is taken from the first body line that is not a heading.
 */
handler::HandlerDescriptor parseMarkdownDescriptor(std::string_view text,
                                                   std::string_view origin,
                                                   std::string_view fallback_name);

} // namespace switchyard::internal::registry
