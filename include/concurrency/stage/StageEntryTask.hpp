#pragma once

#include "concurrency/Task.hpp"
#include "core/TreeWalker.hpp"

#include <filesystem>

namespace masf::stage {
class Stager;
class ErrorLog;
}

namespace masf::concurrency {

struct StageEntryTask final : PromisedTask {
    stage::Stager& stager;
    core::TreeEntry entry;
    std::filesystem::path stagingRoot;
    stage::ErrorLog& errors;

    StageEntryTask(stage::Stager& s, core::TreeEntry e, std::filesystem::path root, stage::ErrorLog& log);

    void operator()() override;
};

}
