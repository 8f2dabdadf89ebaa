#include "engine/journal_store.hpp"

#include <exception>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "common/logging/log.hpp"

namespace wf::engine {

JournalExecutionStore::JournalExecutionStore(std::filesystem::path path) : path_(std::move(path)) {}

JournalExecutionStore::~JournalExecutionStore() {
  std::lock_guard<std::mutex> lock(file_mutex_);
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
}

auto JournalExecutionStore::open(const std::filesystem::path& path)
  -> Expected<std::unique_ptr<JournalExecutionStore>> {
  std::unique_ptr<JournalExecutionStore> store(new JournalExecutionStore(path));
  if (auto parent = path.parent_path(); !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return tl::unexpected(make_error(
        ErrorCode::Storage, fmt::format("cannot create journal directory {}: {}", parent.string(), ec.message())));
    }
  }
  if (auto replayed = store->replay(); !replayed) {
    return tl::unexpected(replayed.error());
  }
  store->out_.open(path, std::ios::out | std::ios::app);
  if (!store->out_) {
    return tl::unexpected(
      make_error(ErrorCode::Storage, fmt::format("cannot open journal for append: {}", path.string())));
  }
  wf::log::info("Journal store opened: path={}, records={}", path.string(), store->replayed_);
  return store;
}

auto JournalExecutionStore::replay() -> Expected<void> {
  std::ifstream in(path_);
  if (!in) {
    return {};
  }
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    line_number += 1;
    if (line.empty()) {
      continue;
    }
    Json record;
    try {
      record = Json::parse(line);
    } catch (const std::exception& ex) {
      // A torn final line is what a crash mid-append leaves behind.
      if (in.peek() == std::char_traits<char>::eof()) {
        wf::log::warn("Ignoring truncated journal tail at {}:{}: {}", path_.string(), line_number, ex.what());
        break;
      }
      return tl::unexpected(make_error(
        ErrorCode::Storage, fmt::format("corrupt journal record at {}:{}: {}", path_.string(), line_number, ex.what())));
    }

    auto op = record.value("op", std::string{});
    if (op == "put") {
      auto snapshot = snapshot_from_json(record["snapshot"]);
      if (!snapshot) {
        return tl::unexpected(snapshot.error());
      }
      restore(std::move(*snapshot));
    } else if (op == "delete") {
      forget(record.value("id", std::string{}));
    } else {
      return tl::unexpected(make_error(
        ErrorCode::Storage, fmt::format("unknown journal op '{}' at {}:{}", op, path_.string(), line_number)));
    }
    replayed_ += 1;
  }
  return {};
}

auto JournalExecutionStore::append(const Json& record) -> Expected<void> {
  std::lock_guard<std::mutex> lock(file_mutex_);
  if (!out_.is_open()) {
    return tl::unexpected(make_error(ErrorCode::Storage, "journal is not open"));
  }
  // Invalid UTF-8 from action payloads is stored as U+FFFD instead of failing the commit.
  out_ << record.dump(-1, ' ', false, Json::error_handler_t::replace) << '\n';
  out_.flush();
  if (!out_) {
    return tl::unexpected(make_error(ErrorCode::Storage, fmt::format("journal write failed: {}", path_.string())));
  }
  return {};
}

auto JournalExecutionStore::persist(const ExecutionSnapshot& snapshot) -> Expected<void> {
  return append(Json{{"op", "put"}, {"snapshot", to_json(snapshot)}});
}

auto JournalExecutionStore::persist_delete(std::string_view execution_id) -> Expected<void> {
  return append(Json{{"op", "delete"}, {"id", std::string(execution_id)}});
}

}  // namespace wf::engine
