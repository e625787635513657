#include "core/job_journal.hpp"
#include "core/job_json.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include <filesystem>

namespace speechjobs {
namespace core {

namespace fs = std::filesystem;

JobJournal::JobJournal(const std::string& directory)
    : directory_(directory) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw utils::ValidationException("Cannot create journal directory", directory_ + ": " + ec.message());
    }
}

std::string JobJournal::pathFor(const std::string& jobId) const {
    return (fs::path(directory_) / (jobId + ".json")).string();
}

bool JobJournal::record(const Job& job) {
    nlohmann::json document;
    try {
        document = job;
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Failed to encode job " + job.id + ": " + e.what());
        return false;
    }
    return utils::writeJsonFileAtomically(pathFor(job.id), document);
}

void JobJournal::erase(const std::string& jobId) {
    std::error_code ec;
    if (!fs::remove(pathFor(jobId), ec) && ec) {
        utils::Logger::warn("Failed to remove journal record for job " + jobId + ": " + ec.message());
    }
}

std::vector<Job> JobJournal::loadAll() const {
    std::vector<Job> jobs;
    std::error_code ec;

    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        try {
            jobs.push_back(utils::readJsonFile(entry.path().string()).get<Job>());
        } catch (const utils::SpeechJobsException& e) {
            utils::Logger::warn("Skipping unreadable journal record " + entry.path().string() + ": " + e.what());
        } catch (const nlohmann::json::exception& e) {
            utils::Logger::warn("Skipping malformed journal record " + entry.path().string() + ": " + e.what());
        }
    }

    if (ec) {
        utils::Logger::error("Failed to scan journal directory " + directory_ + ": " + ec.message());
    }
    return jobs;
}

} // namespace core
} // namespace speechjobs
