#include "concurrency/stage/StageEntryTask.hpp"
#include "stage/Stager.hpp"
#include "stage/ErrorLog.hpp"
#include "log/Registry.hpp"

using namespace masf::concurrency;

StageEntryTask::StageEntryTask(stage::Stager& s, core::TreeEntry e, std::filesystem::path root, stage::ErrorLog& log)
    : stager(s), entry(std::move(e)), stagingRoot(std::move(root)), errors(log) {}

void StageEntryTask::operator()() {
    try {
        stager.stageEntry(entry, stagingRoot, errors);
        promise.set_value(true);
    } catch (const std::exception& e) {
        log::Registry::stager()->error("[StageEntryTask] Failed to stage {}: {}", entry.path.string(), e.what());
        errors.add(entry.path, e.what());
        promise.set_value(std::string(e.what()));
    }
}
