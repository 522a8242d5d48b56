#pragma once
/**
 * @file repair_pipeline.hpp
 * @brief Transactional repair of one scene file: lock, detect, back up, repair, write,
 *        verify, and roll back on failure.
 *
 * State machine of one run:
 *
 * @code
 *   Idle -> Locking -> Detecting -> Done                              (nothing to repair)
 *                               -> BackingUp -> Repairing -> Writing -> Verifying -> Committed
 *                                                             |           |
 *                                                             +-----------+-> RollingBack
 *                                                                               -> RolledBack
 *                                                                               -> Failed
 *   Aborted: lock timeout, load failure, backup failure or cancellation, before any
 *            mutation of the document.
 * @endcode
 *
 * The per-path FileLock is held from Locking until the run reaches a terminal state, so
 * two runs on the same path never interleave while runs on different paths proceed in
 * parallel. A CancellationToken is honoured before Detecting, BackingUp and Writing;
 * once Writing has begun the run completes and the outcome records the deferral.
 */
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <vector>

#include "repair/backup_manager.hpp"
#include "repair/detector.hpp"
#include "repair/document_store.hpp"
#include "repair/repair_error.hpp"
#include "repair/repairer.hpp"
#include "scenefix_utils_export.h"
#include "utils/logger.hpp"

namespace scenefix::repair
{

enum class RepairState
{
    Idle,
    Locking,
    Detecting,
    Done,
    BackingUp,
    Repairing,
    Writing,
    Verifying,
    Committed,
    RollingBack,
    RolledBack,
    Failed,
    Aborted
};

SCENEFIX_UTILS_EXPORT const char *to_string(RepairState state) noexcept;

/// Terminal states: Done, Committed, RolledBack, Failed, Aborted.
SCENEFIX_UTILS_EXPORT bool is_terminal(RepairState state) noexcept;

class CancellationToken
{
  public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    [[nodiscard]] bool cancelled() const noexcept
    {
        return cancelled_.load(std::memory_order_acquire);
    }

  private:
    std::atomic<bool> cancelled_{false};
};

/// Told when a repair has been committed, so the host can reload its scenes.
class SCENEFIX_UTILS_EXPORT ReloadNotifier
{
  public:
    virtual ~ReloadNotifier() = default;
    virtual void on_committed(const std::filesystem::path &path, DefectClass cls) = 0;
};

struct SCENEFIX_UTILS_EXPORT RepairOutcome
{
    RepairState state{RepairState::Idle};
    std::vector<RepairState> trace;
    std::optional<RepairError> error;
    std::optional<BackupHandle> backup;
    size_t findings_repaired{0};
    bool cancellation_deferred{false};

    /// Done or Committed.
    [[nodiscard]] bool succeeded() const noexcept;
};

struct RepairPipelineOptions
{
    /// Lock wait limit; std::nullopt waits indefinitely.
    std::optional<std::chrono::milliseconds> lock_timeout;
    /// Verification also compares the reloaded document with the repaired one.
    bool verify_content{true};
};

class SCENEFIX_UTILS_EXPORT RepairPipeline
{
  public:
    /**
     * @param store, backups Must outlive the pipeline; may be subclasses.
     * @param notifier Optional; must outlive the pipeline when given.
     */
    RepairPipeline(utils::Logger &logger, DocumentStore &store, BackupManager &backups,
                   Repairer repairer = Repairer{}, ReloadNotifier *notifier = nullptr,
                   RepairPipelineOptions options = {});

    RepairPipeline(const RepairPipeline &) = delete;
    RepairPipeline &operator=(const RepairPipeline &) = delete;

    /// Runs one repair of @p cls on @p path to a terminal state.
    [[nodiscard]] RepairOutcome repair(const std::filesystem::path &path, DefectClass cls,
                                       const CancellationToken *cancel = nullptr);

    /// repair() on a worker thread. The pipeline must outlive the returned future.
    [[nodiscard]] std::future<RepairOutcome>
    repair_async(std::filesystem::path path, DefectClass cls,
                 std::shared_ptr<const CancellationToken> cancel = nullptr);

    /// Findings of both defect classes in @p doc; duplicates first.
    [[nodiscard]] Findings detect(const SceneDocument &doc) const;

    [[nodiscard]] Findings detect(const SceneDocument &doc, DefectClass cls) const;

  private:
    class Run;

    utils::Logger &logger_;
    DocumentStore &store_;
    BackupManager &backups_;
    Repairer repairer_;
    ReloadNotifier *notifier_;
    RepairPipelineOptions options_;
};

} // namespace scenefix::repair
