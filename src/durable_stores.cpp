#include "sz/durable_stores.hpp"

#include "sz/errors.hpp"

#include "debug_log.hpp"
#include "json_bridge.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sz {

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw StoreUnavailable("Failed to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw StoreUnavailable("Failed to read " + path.string());
  }
  return buffer.str();
}

nlohmann::json parse_document(const std::string& text, const fs::path& path) {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& ex) {
    throw StoreUnavailable("Corrupt document " + path.string() + ": " + ex.what());
  }
}

void ensure_directory(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw StoreUnavailable("Failed to create " + dir.string() + ": " + ec.message());
  }
}

void write_atomic(const fs::path& final_path, const std::string& content) {
  ensure_directory(final_path.parent_path());

  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path temp_path = final_path;
  temp_path += "." + std::to_string(stamp) + ".tmp";

  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw StoreUnavailable("Failed to open temp file " + temp_path.string());
    }
    out << content;
    out.flush();
    if (out.fail()) {
      out.close();
      std::error_code ignored;
      fs::remove(temp_path, ignored);
      throw StoreUnavailable("Write failed for " + temp_path.string());
    }
  }

  std::error_code ec;
  fs::rename(temp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp_path, ignored);
    throw StoreUnavailable("Rename failed for " + final_path.string() + ": " + ec.message());
  }
}

template <typename Convert>
auto decode(const nlohmann::json& json, const fs::path& path, Convert&& convert)
    -> decltype(convert(json)) {
  try {
    return convert(json);
  } catch (const std::invalid_argument& ex) {
    throw StoreUnavailable("Invalid document " + path.string() + ": " + ex.what());
  } catch (const nlohmann::json::exception& ex) {
    throw StoreUnavailable("Invalid document " + path.string() + ": " + ex.what());
  }
}

} // namespace

std::string encode_path_component(const std::string& id) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(id.size());
  for (unsigned char ch : id) {
    const bool safe = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                      (ch >= '0' && ch <= '9') || ch == '-' || ch == '_';
    if (safe) {
      out.push_back(static_cast<char>(ch));
    } else {
      out.push_back('%');
      out.push_back(hex[ch >> 4]);
      out.push_back(hex[ch & 0x0F]);
    }
  }
  if (out.empty()) {
    out = "%";
  }
  return out;
}

// ---------------------------------------------------------------------------
// InMemoryDurableStore

std::optional<ReviewState> InMemoryDurableStore::load_review(const std::string& user_id,
                                                             const std::string& item_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = reviews_.find({user_id, item_id});
  if (it == reviews_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryDurableStore::compare_and_swap_review(const ReviewState& desired,
                                                   std::uint64_t expected_version,
                                                   std::optional<ReviewState>& current) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto key = std::make_pair(desired.user_id, desired.item_id);
  auto it = reviews_.find(key);
  const std::uint64_t stored_version = it == reviews_.end() ? 0 : it->second.version;
  if (stored_version != expected_version) {
    if (it == reviews_.end()) {
      current.reset();
    } else {
      current = it->second;
    }
    return false;
  }
  ReviewState record = desired;
  record.version = expected_version + 1;
  reviews_[key] = record;
  current = record;
  return true;
}

std::vector<ReviewState> InMemoryDurableStore::reviews_for_user(const std::string& user_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<ReviewState> out;
  for (auto it = reviews_.lower_bound({user_id, std::string()});
       it != reviews_.end() && it->first.first == user_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::optional<SessionContext> InMemoryDurableStore::load_session(const std::string& session_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryDurableStore::store_session(const SessionContext& session) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  sessions_[session.session_id] = session;
}

void InMemoryDurableStore::append_events(const std::string& session_id,
                                         const std::vector<InteractionEvent>& events) {
  if (events.empty()) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto& log = events_[session_id];
  log.insert(log.end(), events.begin(), events.end());
}

std::vector<InteractionEvent> InMemoryDurableStore::load_events(const std::string& session_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = events_.find(session_id);
  if (it == events_.end()) {
    return {};
  }
  return it->second;
}

std::size_t InMemoryDurableStore::session_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sessions_.size();
}

// ---------------------------------------------------------------------------
// FileDurableStore

FileDurableStore::FileDurableStore(fs::path root) : root_(std::move(root)) {
  ensure_directory(root_ / "reviews");
  ensure_directory(root_ / "sessions");
  ensure_directory(root_ / "events");
}

fs::path FileDurableStore::review_path(const std::string& user_id,
                                       const std::string& item_id) const {
  return root_ / "reviews" / encode_path_component(user_id) /
         (encode_path_component(item_id) + ".json");
}

fs::path FileDurableStore::session_path(const std::string& session_id) const {
  return root_ / "sessions" / (encode_path_component(session_id) + ".json");
}

fs::path FileDurableStore::events_path(const std::string& session_id) const {
  return root_ / "events" / (encode_path_component(session_id) + ".jsonl");
}

std::optional<ReviewState> FileDurableStore::read_review_unlocked(const fs::path& path) const {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      throw StoreUnavailable("Failed to stat " + path.string() + ": " + ec.message());
    }
    return std::nullopt;
  }
  auto json = parse_document(read_file(path), path);
  return decode(json, path, [](const nlohmann::json& j) { return bridge::review_state_from_json(j); });
}

std::optional<ReviewState> FileDurableStore::load_review(const std::string& user_id,
                                                         const std::string& item_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return read_review_unlocked(review_path(user_id, item_id));
}

bool FileDurableStore::compare_and_swap_review(const ReviewState& desired,
                                               std::uint64_t expected_version,
                                               std::optional<ReviewState>& current) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto path = review_path(desired.user_id, desired.item_id);
  auto stored = read_review_unlocked(path);
  const std::uint64_t stored_version = stored.has_value() ? stored->version : 0;
  if (stored_version != expected_version) {
    current = stored;
    return false;
  }
  ReviewState record = desired;
  record.version = expected_version + 1;
  write_atomic(path, bridge::to_json(record).dump(2));
  current = record;
  log::debug("store", "cas review " + record.user_id + "/" + record.item_id + " v" +
                          std::to_string(record.version));
  return true;
}

std::vector<ReviewState> FileDurableStore::reviews_for_user(const std::string& user_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto dir = root_ / "reviews" / encode_path_component(user_id);
  std::vector<ReviewState> out;
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return out;
  }
  fs::directory_iterator it(dir, ec);
  if (ec) {
    throw StoreUnavailable("Failed to list " + dir.string() + ": " + ec.message());
  }
  for (const auto& entry : it) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") {
      continue;
    }
    if (auto state = read_review_unlocked(entry.path())) {
      out.push_back(std::move(*state));
    }
  }
  return out;
}

std::optional<SessionContext> FileDurableStore::load_session(const std::string& session_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto path = session_path(session_id);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      throw StoreUnavailable("Failed to stat " + path.string() + ": " + ec.message());
    }
    return std::nullopt;
  }
  auto json = parse_document(read_file(path), path);
  return decode(json, path,
                [](const nlohmann::json& j) { return bridge::session_context_from_json(j); });
}

void FileDurableStore::store_session(const SessionContext& session) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  write_atomic(session_path(session.session_id), bridge::to_json(session).dump(2));
}

void FileDurableStore::append_events(const std::string& session_id,
                                     const std::vector<InteractionEvent>& events) {
  if (events.empty()) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto path = events_path(session_id);
  ensure_directory(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::app);
  if (!out.is_open()) {
    throw StoreUnavailable("Failed to open event log " + path.string());
  }
  for (const auto& event : events) {
    out << bridge::to_json(event).dump() << '\n';
  }
  out.flush();
  if (out.fail()) {
    throw StoreUnavailable("Append failed for " + path.string());
  }
}

std::vector<InteractionEvent> FileDurableStore::load_events(const std::string& session_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto path = events_path(session_id);
  std::vector<InteractionEvent> out;
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return out;
  }
  std::istringstream lines(read_file(path));
  std::string line;
  while (std::getline(lines, line)) {
    if (line.empty()) {
      continue;
    }
    nlohmann::json json;
    try {
      json = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
      // A torn trailing line from an interrupted append.
      log::warn("store", "skipping unreadable event line in " + path.string());
      continue;
    }
    out.push_back(decode(json, path, [](const nlohmann::json& j) {
      return bridge::interaction_event_from_json(j);
    }));
  }
  return out;
}

} // namespace sz
