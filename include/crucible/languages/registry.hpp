#pragma once

#include "crucible/common/result.hpp"
#include "crucible/config/schema.hpp"
#include "crucible/languages/language.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace crucible::languages {

/// Identifier → language table. Lookups are case-insensitive and registration of
/// an existing id replaces it. Safe to register while other threads resolve.
class LanguageRegistry {
public:
  LanguageRegistry() = default;

  [[nodiscard]] common::Status register_language(std::shared_ptr<const ILanguage> language);
  [[nodiscard]] common::Status register_spec(LanguageSpec spec);
  [[nodiscard]] common::Status register_config_languages(
      const std::vector<config::LanguageEntry> &entries);

  [[nodiscard]] common::Result<std::shared_ptr<const ILanguage>> resolve(std::string_view id) const;
  [[nodiscard]] bool contains(std::string_view id) const;
  [[nodiscard]] std::vector<std::string> ids() const;

  [[nodiscard]] static std::shared_ptr<LanguageRegistry> with_builtins();

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const ILanguage>> by_id_;
};

} // namespace crucible::languages
