#pragma once

#include "env/environment.h"
#include "kernel/kernel_simulation.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct lua_State;

namespace flowsim::script {

// Sandboxed LuaJIT script supplying an optional reward and an optional
// policy:
//   flowsim_reward(time, speeds) -> number
//   flowsim_actions(ids, speeds) -> { [id] = target_speed, ... } or nil
class LuaPolicyScript final {
public:
    static constexpr std::size_t kInstructionBudgetPerCall = 1000000;
    static constexpr std::size_t kMemoryBudgetBytes = 64 * 1024 * 1024;

    LuaPolicyScript() = default;
    ~LuaPolicyScript();

    LuaPolicyScript(const LuaPolicyScript&) = delete;
    LuaPolicyScript& operator=(const LuaPolicyScript&) = delete;

    bool LoadFile(const std::filesystem::path& script_path, std::string& out_error);
    bool LoadSource(std::string_view chunk_name, std::string_view source, std::string& out_error);
    void Shutdown();

    bool IsLoaded() const;
    bool HasRewardFunction() const;
    bool HasActionFunction() const;

    bool ComputeReward(
        double simulation_time,
        const std::vector<double>& speeds,
        double& out_reward,
        std::string& out_error);
    bool ComputeActions(
        const std::vector<std::string>& vehicle_ids,
        const std::vector<double>& speeds,
        std::vector<kernel::VehicleCommand>& out_commands,
        std::string& out_error);

    // The returned callables borrow this script and must not outlive it.
    env::RewardFunction MakeRewardFunction();
    env::ActionFunction MakeActionFunction();

private:
    struct MemoryQuotaState final {
        std::size_t bytes_in_use = 0;
        std::size_t limit_bytes = kMemoryBudgetBytes;
    };

    static void* QuotaAllocator(void* user_data, void* pointer, size_t old_size, size_t new_size);
    bool ApplySandbox(std::string& out_error);
    bool HasGlobalFunction(const char* function_name) const;

    lua_State* lua_state_ = nullptr;
    MemoryQuotaState memory_quota_state_{};
    std::string chunk_name_;
};

}  // namespace flowsim::script
