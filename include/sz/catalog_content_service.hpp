#pragma once

#include "collaborators.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sz {

/**
 * CatalogContentService serves published items from an in-memory catalog.
 * The catalog can be seeded programmatically or from a JSON document of the
 * form {"items": [ {id, domains, base_difficulty, payload_ref, kind}, ... ]}.
 */
class CatalogContentService : public ContentService {
public:
  CatalogContentService() = default;
  explicit CatalogContentService(std::vector<LearningItem> items);

  // Replaces an existing item with the same id.
  void add_item(LearningItem item);

  std::size_t size() const;
  std::optional<LearningItem> find(const std::string& item_id) const;

  std::vector<LearningItem> fetch_items(const std::string& domain, const DifficultyRange& range,
                                        const std::unordered_set<std::string>& exclude_ids) override;

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, LearningItem> items_;
};

std::vector<LearningItem> parse_catalog_document(const nlohmann::json& document);
std::vector<LearningItem> load_catalog(const std::filesystem::path& path);

} // namespace sz
