#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string_view>

#include "engine/error.hpp"
#include "engine/state_store.hpp"

namespace wf::engine {

/// Execution store that survives restarts by appending every committed
/// snapshot to a JSON-lines journal before it becomes visible.
class JournalExecutionStore : public MemoryExecutionStore {
 public:
  /// Open (creating if needed) and replay the journal at `path`.
  static auto open(const std::filesystem::path& path) -> Expected<std::unique_ptr<JournalExecutionStore>>;

  ~JournalExecutionStore() override;

  auto path() const -> const std::filesystem::path& { return path_; }
  /// Number of journal records applied while opening.
  auto replayed_records() const -> std::size_t { return replayed_; }

 protected:
  auto persist(const ExecutionSnapshot& snapshot) -> Expected<void> override;
  auto persist_delete(std::string_view execution_id) -> Expected<void> override;

 private:
  explicit JournalExecutionStore(std::filesystem::path path);

  auto replay() -> Expected<void>;
  auto append(const Json& record) -> Expected<void>;

  std::filesystem::path path_;
  std::mutex file_mutex_;
  std::ofstream out_;
  std::size_t replayed_ = 0;
};

}  // namespace wf::engine
