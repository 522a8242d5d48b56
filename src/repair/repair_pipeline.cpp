#include "repair/repair_pipeline.hpp"

#include <fmt/format.h>

#include "sfx_platform.hpp"
#include "utils/atomic_file.hpp"
#include "utils/file_lock.hpp"

namespace fs = std::filesystem;

namespace scenefix::repair
{

const char *to_string(RepairState state) noexcept
{
    switch (state)
    {
    case RepairState::Idle:
        return "Idle";
    case RepairState::Locking:
        return "Locking";
    case RepairState::Detecting:
        return "Detecting";
    case RepairState::Done:
        return "Done";
    case RepairState::BackingUp:
        return "BackingUp";
    case RepairState::Repairing:
        return "Repairing";
    case RepairState::Writing:
        return "Writing";
    case RepairState::Verifying:
        return "Verifying";
    case RepairState::Committed:
        return "Committed";
    case RepairState::RollingBack:
        return "RollingBack";
    case RepairState::RolledBack:
        return "RolledBack";
    case RepairState::Failed:
        return "Failed";
    case RepairState::Aborted:
        return "Aborted";
    }
    return "Unknown";
}

bool is_terminal(RepairState state) noexcept
{
    switch (state)
    {
    case RepairState::Done:
    case RepairState::Committed:
    case RepairState::RolledBack:
    case RepairState::Failed:
    case RepairState::Aborted:
        return true;
    default:
        return false;
    }
}

bool RepairOutcome::succeeded() const noexcept
{
    return state == RepairState::Done || state == RepairState::Committed;
}

// ---- one run ---------------------------------------------------------------------------

class RepairPipeline::Run
{
  public:
    Run(RepairPipeline &owner, const fs::path &path, DefectClass cls,
        const CancellationToken *cancel)
        : owner_(owner), logger_(owner.logger_), path_(path), cls_(cls), cancel_(cancel)
    {
        outcome_.trace.push_back(RepairState::Idle);
    }

    RepairOutcome execute()
    {
        const uint64_t start_ns = platform::monotonic_time_ns();
        RepairOutcome outcome = run_states();
        SFX_LOG_INFO(logger_, "Repair of '{}' ({}) ended {} after {:.3f} ms", path_.string(),
                     to_string(cls_), to_string(outcome.state),
                     static_cast<double>(platform::elapsed_time_ns(start_ns)) / 1e6);
        return outcome;
    }

  private:
    RepairOutcome run_states()
    {
        SFX_LOG_INFO(logger_, "Repair of '{}' ({}) started", path_.string(), to_string(cls_));

        enter(RepairState::Locking);
        std::optional<utils::FileLock> lock = acquire_lock();
        if (!lock)
            return std::move(outcome_);

        if (cancelled_before(RepairState::Detecting))
            return std::move(outcome_);
        enter(RepairState::Detecting);
        std::optional<SceneDocument> doc = load();
        if (!doc)
            return std::move(outcome_);

        const Findings findings = owner_.detect(*doc, cls_);
        if (findings.empty())
        {
            SFX_LOG_INFO(logger_, "No {} found in '{}'; nothing to repair", to_string(cls_),
                         path_.string());
            return finish(RepairState::Done);
        }
        SFX_LOG_INFO(logger_, "Found {} {} finding(s) in '{}'", findings.size(), to_string(cls_),
                     path_.string());

        if (cancelled_before(RepairState::BackingUp))
            return std::move(outcome_);
        enter(RepairState::BackingUp);
        if (!back_up())
            return std::move(outcome_);

        enter(RepairState::Repairing);
        const SceneDocument repaired = owner_.repairer_.repair(*doc, cls_);
        outcome_.findings_repaired = findings.size();

        if (cancelled_before(RepairState::Writing))
            return std::move(outcome_);
        enter(RepairState::Writing);
        if (auto err = write(repaired))
            return roll_back(std::move(*err));

        enter(RepairState::Verifying);
        if (auto err = verify(repaired))
            return roll_back(std::move(*err));

        enter(RepairState::Committed);
        SFX_LOG_INFO(logger_, "Repair of '{}' ({}) committed; {} finding(s) repaired",
                     path_.string(), to_string(cls_), outcome_.findings_repaired);
        notify();
        return finish(RepairState::Committed);
    }

    void enter(RepairState next)
    {
        SFX_LOG_DEBUG(logger_, "Repair '{}' ({}): {} -> {}", path_.string(), to_string(cls_),
                      to_string(outcome_.state), to_string(next));
        outcome_.state = next;
        outcome_.trace.push_back(next);
    }

    RepairError make_error(RepairErrc code, std::string cause, int os_error = 0) const
    {
        return RepairError{code, path_.string(), cls_, std::move(cause), os_error};
    }

    void set_aborted(RepairError err)
    {
        SFX_LOG_ERROR(logger_, "Repair aborted: {}", err.describe());
        outcome_.error = std::move(err);
        enter(RepairState::Aborted);
    }

    RepairOutcome abort(RepairError err)
    {
        set_aborted(std::move(err));
        return std::move(outcome_);
    }

    // Terminal states after the document may have been touched.
    RepairOutcome finish(RepairState terminal)
    {
        if (outcome_.state != terminal)
            enter(terminal);
        if (cancel_ != nullptr && cancel_->cancelled() && outcome_.state != RepairState::Done)
        {
            outcome_.cancellation_deferred = true;
            SFX_LOG_INFO(logger_, "Cancellation of '{}' was requested after writing began; "
                                  "the run completed as {}",
                         path_.string(), to_string(outcome_.state));
        }
        return std::move(outcome_);
    }

    bool cancelled_before(RepairState next)
    {
        if (cancel_ == nullptr || !cancel_->cancelled())
            return false;
        SFX_LOG_INFO(logger_, "Repair of '{}' cancelled before {}", path_.string(),
                     to_string(next));
        outcome_.error = make_error(RepairErrc::Cancelled,
                                    fmt::format("cancelled before {}", to_string(next)));
        enter(RepairState::Aborted);
        return true;
    }

    std::optional<utils::FileLock> acquire_lock()
    {
        const auto &timeout = owner_.options_.lock_timeout;
        std::optional<utils::FileLock> lock;
        if (timeout)
            lock.emplace(path_, *timeout);
        else
            lock.emplace(path_, utils::LockMode::Blocking);

        if (lock->valid())
            return lock;

        const std::error_code ec = lock->error_code();
        if (ec == std::errc::no_such_file_or_directory)
        {
            set_aborted(make_error(RepairErrc::NotFound,
                                   fmt::format("cannot lock: {}", ec.message()), ec.value()));
        }
        else if (ec == std::errc::timed_out || ec == std::errc::resource_unavailable_try_again)
        {
            set_aborted(make_error(RepairErrc::LockTimeout,
                             fmt::format("lock not acquired within {} ms",
                                         timeout ? timeout->count() : 0),
                             ec.value()));
        }
        else
        {
            set_aborted(make_error(RepairErrc::Io,
                                   fmt::format("cannot lock: {}", ec.message()), ec.value()));
        }
        return std::nullopt;
    }

    std::optional<SceneDocument> load()
    {
        try
        {
            auto loaded = owner_.store_.load(path_);
            if (loaded.is_ok())
                return std::move(loaded).content();
            set_aborted(RepairError::from_result(loaded, path_.string(), cls_));
        }
        catch (const std::exception &e)
        {
            set_aborted(make_error(RepairErrc::Io, fmt::format("load threw: {}", e.what())));
        }
        return std::nullopt;
    }

    bool back_up()
    {
        try
        {
            auto backup = owner_.backups_.backup(path_);
            if (backup.is_ok())
            {
                outcome_.backup = backup.content();
                return true;
            }
            set_aborted(RepairError::from_result(backup, path_.string(), cls_));
        }
        catch (const std::exception &e)
        {
            set_aborted(make_error(RepairErrc::Io, fmt::format("backup threw: {}", e.what())));
        }
        return false;
    }

    std::optional<RepairError> write(const SceneDocument &repaired)
    {
        try
        {
            auto written = owner_.store_.write(path_, repaired);
            if (written.is_ok())
                return std::nullopt;
            return RepairError::from_result(written, path_.string(), cls_);
        }
        catch (const std::exception &e)
        {
            return make_error(RepairErrc::Io, fmt::format("write threw: {}", e.what()));
        }
    }

    std::optional<RepairError> verify(const SceneDocument &repaired)
    {
        try
        {
            auto reloaded = owner_.store_.load(path_);
            if (!reloaded.is_ok())
            {
                return make_error(RepairErrc::Verification,
                                  fmt::format("written file does not reload: {}",
                                              reloaded.detail()),
                                  reloaded.error_code());
            }
            if (owner_.options_.verify_content && reloaded.content() != repaired)
            {
                return make_error(RepairErrc::Verification,
                                  "reloaded content differs from the repaired document");
            }
            return std::nullopt;
        }
        catch (const std::exception &e)
        {
            return make_error(RepairErrc::Verification,
                              fmt::format("verification threw: {}", e.what()));
        }
    }

    RepairOutcome roll_back(RepairError cause)
    {
        SFX_LOG_ERROR(logger_, "Repair failed, rolling back: {}", cause.describe());
        enter(RepairState::RollingBack);

        auto restored = restore();
        if (restored.is_ok())
        {
            SFX_LOG_WARN(logger_, "'{}' rolled back to '{}'", path_.string(),
                         outcome_.backup->backup_path.string());
            outcome_.error = std::move(cause);
            return finish(RepairState::RolledBack);
        }

        // A write that failed before its rename leaves the original in place.
        if (matches_backup())
        {
            SFX_LOG_WARN(logger_, "Restoring '{}' failed ({}) but it still matches '{}'",
                         path_.string(), restored.detail(),
                         outcome_.backup->backup_path.string());
            outcome_.error = std::move(cause);
            return finish(RepairState::RolledBack);
        }

        RepairError failure =
            make_error(RepairErrc::RollbackFailure,
                       fmt::format("{}; restoring backup '{}' failed: {}", cause.cause,
                                   outcome_.backup->backup_path.string(), restored.detail()),
                       restored.error_code());
        SFX_LOG_ERROR(logger_, "Rollback failed: {}", failure.describe());
        outcome_.error = std::move(failure);
        return finish(RepairState::Failed);
    }

    RepairStatus restore()
    {
        try
        {
            return owner_.backups_.restore(*outcome_.backup);
        }
        catch (const std::exception &e)
        {
            return RepairStatus::error(RepairErrc::Io, 0,
                                       fmt::format("restore threw: {}", e.what()));
        }
    }

    bool matches_backup() const
    {
        std::error_code ec;
        const auto current = utils::read_file(path_, &ec);
        if (!current)
            return false;
        const auto saved = utils::read_file(outcome_.backup->backup_path, &ec);
        return saved && *saved == *current;
    }

    void notify()
    {
        if (owner_.notifier_ == nullptr)
            return;
        try
        {
            owner_.notifier_->on_committed(path_, cls_);
        }
        catch (const std::exception &e)
        {
            SFX_LOG_ERROR(logger_, "Reload notification for '{}' failed: {}", path_.string(),
                          e.what());
        }
    }

    RepairPipeline &owner_;
    utils::Logger &logger_;
    const fs::path path_;
    const DefectClass cls_;
    const CancellationToken *cancel_;
    RepairOutcome outcome_;
};

// ---- pipeline --------------------------------------------------------------------------

RepairPipeline::RepairPipeline(utils::Logger &logger, DocumentStore &store,
                               BackupManager &backups, Repairer repairer,
                               ReloadNotifier *notifier, RepairPipelineOptions options)
    : logger_(logger), store_(store), backups_(backups), repairer_(std::move(repairer)),
      notifier_(notifier), options_(options)
{
}

RepairOutcome RepairPipeline::repair(const fs::path &path, DefectClass cls,
                                     const CancellationToken *cancel)
{
    Run run(*this, path, cls, cancel);
    return run.execute();
}

std::future<RepairOutcome> RepairPipeline::repair_async(fs::path path, DefectClass cls,
                                                        std::shared_ptr<const CancellationToken> cancel)
{
    return std::async(std::launch::async,
                      [this, path = std::move(path), cls, cancel = std::move(cancel)]()
                      { return repair(path, cls, cancel.get()); });
}

Findings RepairPipeline::detect(const SceneDocument &doc) const
{
    Findings all = find_duplicate_ids(doc);
    Findings empties = find_empty_attributes(doc);
    all.insert(all.end(), std::make_move_iterator(empties.begin()),
               std::make_move_iterator(empties.end()));
    return all;
}

Findings RepairPipeline::detect(const SceneDocument &doc, DefectClass cls) const
{
    return scenefix::repair::detect(doc, cls);
}

} // namespace scenefix::repair
