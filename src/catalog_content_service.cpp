#include "sz/catalog_content_service.hpp"

#include "json_bridge.hpp"

#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace sz {

CatalogContentService::CatalogContentService(std::vector<LearningItem> items) {
  for (auto& item : items) {
    add_item(std::move(item));
  }
}

void CatalogContentService::add_item(LearningItem item) {
  if (item.id.empty()) {
    throw std::invalid_argument("Catalog item id must not be empty");
  }
  if (item.domains.empty()) {
    throw std::invalid_argument("Catalog item '" + item.id + "' has no domains");
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const std::string id = item.id;
  items_[id] = std::move(item);
}

std::size_t CatalogContentService::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return items_.size();
}

std::optional<LearningItem> CatalogContentService::find(const std::string& item_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = items_.find(item_id);
  if (it == items_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<LearningItem> CatalogContentService::fetch_items(
    const std::string& domain, const DifficultyRange& range,
    const std::unordered_set<std::string>& exclude_ids) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<LearningItem> out;
  for (const auto& [id, item] : items_) {
    if (exclude_ids.count(id) > 0) {
      continue;
    }
    if (!item.in_domain(domain) || !range.contains(item.base_difficulty)) {
      continue;
    }
    out.push_back(item);
  }
  return out;
}

std::vector<LearningItem> parse_catalog_document(const nlohmann::json& document) {
  const nlohmann::json* items_json = &document;
  if (document.is_object()) {
    if (!document.contains("items")) {
      throw std::runtime_error("Catalog JSON must contain an 'items' array");
    }
    items_json = &document.at("items");
  }
  if (!items_json->is_array()) {
    throw std::runtime_error("Catalog JSON must contain an 'items' array");
  }

  std::vector<LearningItem> items;
  items.reserve(items_json->size());
  for (const auto& entry : *items_json) {
    items.push_back(bridge::learning_item_from_json(entry));
  }
  return items;
}

std::vector<LearningItem> load_catalog(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Catalog not found at: " + path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open catalog: " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  return parse_catalog_document(nlohmann::json::parse(content));
}

} // namespace sz
