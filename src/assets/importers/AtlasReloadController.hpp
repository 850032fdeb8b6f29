// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ResourceImporter.hpp"
#include "TextureAtlas.hpp"
#include <atomic>
#include <set>
#include <string>
#include <vector>

namespace aforge::assets
{
    enum class ReloadState { Idle, Staging, Packing, Merging };
    enum class ReloadOutcome { NothingToDo, Merged, Failed };

    const char* to_string(ReloadState state);
    const char* to_string(ReloadOutcome outcome);

    /// Repacks changed sprite sources into a temporary atlas and merges it
    /// into the live atlas of the target id:
    /// Idle -> Staging -> Packing (temporary atlas) -> Merging -> Idle.
    /// Main thread only.
    class AtlasReloadController
    {
    public:
        explicit AtlasReloadController(AtlasId target);

        ReloadOutcome run(const std::vector<StagedFile>& staged, const ImportContext& ictx, TaskResult& res);

        ReloadState state() const { return state_.load(std::memory_order_acquire); }
        AtlasId target() const { return target_; }

        /// Entry keys reloaded since the last full pack
        const std::set<std::string>& reloaded_keys() const { return reloaded_keys_; }
        void clear_reloaded() { reloaded_keys_.clear(); }

    private:
        TextureAtlasPtr live_atlas(const ImportContext& ictx) const;
        void set_state(ReloadState s) { state_.store(s, std::memory_order_release); }

        AtlasId target_;
        std::atomic<ReloadState> state_{ ReloadState::Idle };
        std::set<std::string> reloaded_keys_;
    };
}
