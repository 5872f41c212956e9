#include "crucible/languages/registry.hpp"

#include "crucible/common/fs.hpp"

#include <algorithm>
#include <mutex>

namespace crucible::languages {

namespace {

std::string normalize_id(std::string_view id) { return common::to_lower(common::trim(std::string(id))); }

} // namespace

common::Status LanguageRegistry::register_language(std::shared_ptr<const ILanguage> language) {
  if (!language) {
    return common::Status::error(common::ErrorKind::Configuration, "language is null");
  }
  const std::string id = normalize_id(language->id());
  if (id.empty()) {
    return common::Status::error(common::ErrorKind::Configuration, "language id is empty");
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  by_id_[id] = std::move(language);
  return common::Status::success();
}

common::Status LanguageRegistry::register_spec(LanguageSpec spec) {
  auto valid = validate_language_spec(spec);
  if (!valid.ok()) {
    return valid;
  }
  return register_language(std::make_shared<CommandLanguage>(std::move(spec)));
}

common::Status
LanguageRegistry::register_config_languages(const std::vector<config::LanguageEntry> &entries) {
  for (const auto &entry : entries) {
    auto registered = register_spec(LanguageSpec{.id = entry.id,
                                                 .image = entry.image,
                                                 .code_filename = entry.code_filename,
                                                 .inline_command = entry.inline_command,
                                                 .run_app_command = entry.run_app_command,
                                                 .install_command = entry.install_command});
    if (!registered.ok()) {
      return registered;
    }
  }
  return common::Status::success();
}

common::Result<std::shared_ptr<const ILanguage>>
LanguageRegistry::resolve(const std::string_view id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = by_id_.find(normalize_id(id));
  if (it == by_id_.end()) {
    return common::Result<std::shared_ptr<const ILanguage>>::failure(
        common::ErrorKind::UnknownLanguage, "unknown language: " + std::string(id));
  }
  return common::Result<std::shared_ptr<const ILanguage>>::success(it->second);
}

bool LanguageRegistry::contains(const std::string_view id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return by_id_.count(normalize_id(id)) > 0;
}

std::vector<std::string> LanguageRegistry::ids() const {
  std::vector<std::string> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(by_id_.size());
    for (const auto &[id, language] : by_id_) {
      out.push_back(id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::shared_ptr<LanguageRegistry> LanguageRegistry::with_builtins() {
  auto registry = std::make_shared<LanguageRegistry>();
  for (auto &spec : builtin_language_specs()) {
    // Built-in specs are well formed.
    (void)registry->register_spec(std::move(spec));
  }
  return registry;
}

} // namespace crucible::languages
