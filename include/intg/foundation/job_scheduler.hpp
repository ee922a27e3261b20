#pragma once

/// @file job_scheduler.hpp
/// @brief Bounded worker pool for blocking loader work, wrapping kcenon thread_system.

#include "intg/foundation/loader_result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace intg::foundation {

/// Upper bound on concurrent filesystem resolutions.
inline constexpr std::size_t kMaxLoadConcurrency = 4;

/// Worker pool used for blocking filesystem and import work.
///
/// Jobs run on a fixed set of kcenon thread_system workers, so no more than
/// @c workerCount() blocking resolutions are in flight at once no matter how
/// many callers request plugins. Jobs must not touch shared loader caches;
/// they hand results back to the thread that waits on them.
///
/// Example:
/// @code
///   JobScheduler pool;                       // kMaxLoadConcurrency workers
///   auto out = std::make_shared<std::vector<std::string>>();
///   auto id = pool.schedule([out] { *out = listDirectory(); });
///   if (id && pool.wait(id.value())) { use(*out); }
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    explicit JobScheduler(std::size_t numThreads = kMaxLoadConcurrency);

    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Enqueue a job.
    /// @return The assigned JobId, or JobScheduleFailed.
    LoaderResult<JobId> schedule(JobFunc job);

    /// Block until the job completes and forget it.
    /// @return Success, JobNotFound, or ThreadError if the job threw.
    LoaderResult<void> wait(JobId id);

    /// Number of worker threads backing the pool.
    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace intg::foundation
