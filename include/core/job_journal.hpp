#pragma once

#include "core/job.hpp"
#include <string>
#include <vector>

namespace speechjobs {
namespace core {

/**
 * Durable job records: one JSON document per job under a directory,
 * published by write-then-rename.
 */
class JobJournal {
public:
    /**
     * @throws ValidationException if the directory cannot be created
     */
    explicit JobJournal(const std::string& directory);

    /**
     * Persist a snapshot, replacing any earlier record of the job
     * @return false if the record could not be written
     */
    bool record(const Job& job);

    void erase(const std::string& jobId);

    /**
     * Load every readable record. Unreadable records are skipped with a warning.
     */
    std::vector<Job> loadAll() const;

    const std::string& directory() const { return directory_; }

private:
    std::string pathFor(const std::string& jobId) const;

    std::string directory_;
};

} // namespace core
} // namespace speechjobs
