#include "script/policy_script.h"

#include "core/logger.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#if defined(FLOWSIM_WITH_LUAJIT)
#include <cmath>
#include <cstdlib>

extern "C" {
#include <lauxlib.h>
#include <lua.h>
#include <luajit.h>
#include <lualib.h>
}
#endif

namespace flowsim::script {
namespace {

constexpr const char* kRewardFunctionName = "flowsim_reward";
constexpr const char* kActionFunctionName = "flowsim_actions";

#if defined(FLOWSIM_WITH_LUAJIT)
std::string ReadLuaError(lua_State* lua_state) {
    const char* error_message = lua_tostring(lua_state, -1);
    std::string output = error_message != nullptr ? error_message : "unknown LuaJIT error";
    lua_pop(lua_state, 1);
    return output;
}

void ClearGlobal(lua_State* lua_state, const char* global_name) {
    lua_pushnil(lua_state);
    lua_setglobal(lua_state, global_name);
}

void InstructionBudgetHook(lua_State* lua_state, lua_Debug* debug) {
    (void)debug;
    luaL_error(lua_state, "instruction budget exceeded");
}

bool RunProtectedLuaCall(
    lua_State* lua_state,
    int instruction_budget_per_call,
    int argument_count,
    int result_count,
    std::string& out_error) {
    lua_sethook(lua_state, InstructionBudgetHook, LUA_MASKCOUNT, instruction_budget_per_call);
    const int run_status = lua_pcall(lua_state, argument_count, result_count, 0);
    lua_sethook(lua_state, nullptr, 0, 0);
    if (run_status != LUA_OK) {
        out_error = ReadLuaError(lua_state);
        return false;
    }

    out_error.clear();
    return true;
}

void PushNumberArray(lua_State* lua_state, const std::vector<double>& values) {
    lua_createtable(lua_state, static_cast<int>(values.size()), 0);
    for (std::size_t index = 0; index < values.size(); ++index) {
        lua_pushnumber(lua_state, values[index]);
        lua_rawseti(lua_state, -2, static_cast<int>(index + 1));
    }
}

void PushStringArray(lua_State* lua_state, const std::vector<std::string>& values) {
    lua_createtable(lua_state, static_cast<int>(values.size()), 0);
    for (std::size_t index = 0; index < values.size(); ++index) {
        lua_pushlstring(lua_state, values[index].data(), values[index].size());
        lua_rawseti(lua_state, -2, static_cast<int>(index + 1));
    }
}
#endif

}  // namespace

LuaPolicyScript::~LuaPolicyScript() {
    Shutdown();
}

void* LuaPolicyScript::QuotaAllocator(
    void* user_data,
    void* pointer,
    size_t old_size,
    size_t new_size) {
#if !defined(FLOWSIM_WITH_LUAJIT)
    (void)user_data;
    (void)pointer;
    (void)old_size;
    (void)new_size;
    return nullptr;
#else
    auto* quota_state = static_cast<MemoryQuotaState*>(user_data);
    if (quota_state == nullptr) {
        return nullptr;
    }

    if (new_size == 0) {
        std::free(pointer);
        quota_state->bytes_in_use -= std::min(old_size, quota_state->bytes_in_use);
        return nullptr;
    }

    if (new_size > old_size &&
        quota_state->bytes_in_use + (new_size - old_size) > quota_state->limit_bytes) {
        return nullptr;
    }

    void* new_pointer = std::realloc(pointer, new_size);
    if (new_pointer == nullptr) {
        return nullptr;
    }

    if (new_size >= old_size) {
        quota_state->bytes_in_use += new_size - old_size;
    } else {
        quota_state->bytes_in_use -= old_size - new_size;
    }
    return new_pointer;
#endif
}

bool LuaPolicyScript::LoadFile(const std::filesystem::path& script_path, std::string& out_error) {
    std::ifstream file(script_path, std::ios::binary);
    if (!file.is_open()) {
        out_error = "Cannot open policy script: " + script_path.string();
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return LoadSource(script_path.filename().string(), content.str(), out_error);
}

bool LuaPolicyScript::LoadSource(
    std::string_view chunk_name,
    std::string_view source,
    std::string& out_error) {
    Shutdown();

#if !defined(FLOWSIM_WITH_LUAJIT)
    (void)chunk_name;
    (void)source;
    out_error = "LuaJIT support is disabled at build time.";
    return false;
#else
    memory_quota_state_.bytes_in_use = 0;
    memory_quota_state_.limit_bytes = kMemoryBudgetBytes;
    lua_state_ = lua_newstate(QuotaAllocator, &memory_quota_state_);
    if (lua_state_ == nullptr) {
        out_error =
            "lua_newstate failed (memory budget=" +
            std::to_string(memory_quota_state_.limit_bytes) + ").";
        return false;
    }

    luaL_openlibs(lua_state_);
    // Count hooks do not fire inside compiled traces.
    luaJIT_setmode(lua_state_, 0, LUAJIT_MODE_ENGINE | LUAJIT_MODE_OFF);
    if (!ApplySandbox(out_error)) {
        Shutdown();
        return false;
    }

    chunk_name_ = std::string(chunk_name);
    const std::string chunk_label = "=" + chunk_name_;
    if (luaL_loadbuffer(lua_state_, source.data(), source.size(), chunk_label.c_str()) != LUA_OK) {
        out_error = "Policy script compile failed (" + chunk_name_ + "): " + ReadLuaError(lua_state_);
        Shutdown();
        return false;
    }

    if (!RunProtectedLuaCall(
            lua_state_,
            static_cast<int>(kInstructionBudgetPerCall),
            0,
            0,
            out_error)) {
        out_error = "Policy script load failed (" + chunk_name_ + "): " + out_error;
        Shutdown();
        return false;
    }

    core::Logger::Info(
        "script",
        "Policy script '" + chunk_name_ + "' loaded: reward=" +
            (HasRewardFunction() ? "yes" : "no") + ", actions=" +
            (HasActionFunction() ? "yes" : "no"));
    out_error.clear();
    return true;
#endif
}

void LuaPolicyScript::Shutdown() {
#if defined(FLOWSIM_WITH_LUAJIT)
    if (lua_state_ != nullptr) {
        lua_close(lua_state_);
    }
#endif
    lua_state_ = nullptr;
    memory_quota_state_.bytes_in_use = 0;
    chunk_name_.clear();
}

bool LuaPolicyScript::IsLoaded() const {
    return lua_state_ != nullptr;
}

bool LuaPolicyScript::HasRewardFunction() const {
    return HasGlobalFunction(kRewardFunctionName);
}

bool LuaPolicyScript::HasActionFunction() const {
    return HasGlobalFunction(kActionFunctionName);
}

bool LuaPolicyScript::ComputeReward(
    double simulation_time,
    const std::vector<double>& speeds,
    double& out_reward,
    std::string& out_error) {
    out_reward = 0.0;
#if !defined(FLOWSIM_WITH_LUAJIT)
    (void)simulation_time;
    (void)speeds;
    out_error = "LuaJIT support is disabled at build time.";
    return false;
#else
    if (lua_state_ == nullptr) {
        out_error = "Policy script is not loaded.";
        return false;
    }

    lua_getglobal(lua_state_, kRewardFunctionName);
    if (!lua_isfunction(lua_state_, -1)) {
        lua_pop(lua_state_, 1);
        out_error.clear();
        return true;
    }

    lua_pushnumber(lua_state_, simulation_time);
    PushNumberArray(lua_state_, speeds);
    if (!RunProtectedLuaCall(
            lua_state_,
            static_cast<int>(kInstructionBudgetPerCall),
            2,
            1,
            out_error)) {
        return false;
    }

    if (lua_type(lua_state_, -1) != LUA_TNUMBER) {
        lua_pop(lua_state_, 1);
        out_error = std::string(kRewardFunctionName) + " must return a number";
        return false;
    }

    out_reward = lua_tonumber(lua_state_, -1);
    lua_pop(lua_state_, 1);
    if (!std::isfinite(out_reward)) {
        out_reward = 0.0;
        out_error = std::string(kRewardFunctionName) + " returned a non-finite value";
        return false;
    }

    out_error.clear();
    return true;
#endif
}

bool LuaPolicyScript::ComputeActions(
    const std::vector<std::string>& vehicle_ids,
    const std::vector<double>& speeds,
    std::vector<kernel::VehicleCommand>& out_commands,
    std::string& out_error) {
    out_commands.clear();
#if !defined(FLOWSIM_WITH_LUAJIT)
    (void)vehicle_ids;
    (void)speeds;
    out_error = "LuaJIT support is disabled at build time.";
    return false;
#else
    if (lua_state_ == nullptr) {
        out_error = "Policy script is not loaded.";
        return false;
    }

    lua_getglobal(lua_state_, kActionFunctionName);
    if (!lua_isfunction(lua_state_, -1)) {
        lua_pop(lua_state_, 1);
        out_error.clear();
        return true;
    }

    PushStringArray(lua_state_, vehicle_ids);
    PushNumberArray(lua_state_, speeds);
    if (!RunProtectedLuaCall(
            lua_state_,
            static_cast<int>(kInstructionBudgetPerCall),
            2,
            1,
            out_error)) {
        return false;
    }

    if (lua_isnil(lua_state_, -1)) {
        lua_pop(lua_state_, 1);
        out_error.clear();
        return true;
    }
    if (!lua_istable(lua_state_, -1)) {
        lua_pop(lua_state_, 1);
        out_error = std::string(kActionFunctionName) + " must return a table or nil";
        return false;
    }

    std::vector<kernel::VehicleCommand> commands;
    lua_pushnil(lua_state_);
    while (lua_next(lua_state_, -2) != 0) {
        if (lua_type(lua_state_, -2) != LUA_TSTRING || lua_type(lua_state_, -1) != LUA_TNUMBER) {
            lua_pop(lua_state_, 3);
            out_error = std::string(kActionFunctionName) + " must map vehicle ids to numbers";
            return false;
        }

        std::size_t id_length = 0;
        const char* id_text = lua_tolstring(lua_state_, -2, &id_length);
        commands.push_back(kernel::VehicleCommand{
            .vehicle_id = std::string(id_text, id_length),
            .target_speed = lua_tonumber(lua_state_, -1),
        });
        lua_pop(lua_state_, 1);
    }
    lua_pop(lua_state_, 1);

    // Table iteration order is unspecified.
    std::sort(
        commands.begin(),
        commands.end(),
        [](const kernel::VehicleCommand& lhs, const kernel::VehicleCommand& rhs) {
            return lhs.vehicle_id < rhs.vehicle_id;
        });
    out_commands = std::move(commands);
    out_error.clear();
    return true;
#endif
}

env::RewardFunction LuaPolicyScript::MakeRewardFunction() {
    return [this](const kernel::IKernelSimulation& kernel, double& out_reward, std::string& out_error) {
        return ComputeReward(kernel.SimulationTime(), kernel.Vehicles().AllSpeeds(), out_reward, out_error);
    };
}

env::ActionFunction LuaPolicyScript::MakeActionFunction() {
    return [this](
               const env::Observation& observation,
               const kernel::VehicleStateCache& vehicles,
               env::Action& out_action,
               std::string& out_error) {
        return ComputeActions(vehicles.Ids(), observation, out_action.commands, out_error);
    };
}

bool LuaPolicyScript::ApplySandbox(std::string& out_error) {
#if !defined(FLOWSIM_WITH_LUAJIT)
    (void)out_error;
    return false;
#else
    if (lua_state_ == nullptr) {
        out_error = "Lua state is null.";
        return false;
    }

    ClearGlobal(lua_state_, "io");
    ClearGlobal(lua_state_, "os");
    ClearGlobal(lua_state_, "debug");
    ClearGlobal(lua_state_, "package");
    ClearGlobal(lua_state_, "dofile");
    ClearGlobal(lua_state_, "loadfile");
    ClearGlobal(lua_state_, "load");
    ClearGlobal(lua_state_, "loadstring");
    ClearGlobal(lua_state_, "require");
    ClearGlobal(lua_state_, "collectgarbage");
    ClearGlobal(lua_state_, "jit");

    lua_getglobal(lua_state_, "string");
    if (lua_istable(lua_state_, -1)) {
        lua_pushnil(lua_state_);
        lua_setfield(lua_state_, -2, "dump");
    }
    lua_pop(lua_state_, 1);

    out_error.clear();
    return true;
#endif
}

bool LuaPolicyScript::HasGlobalFunction(const char* function_name) const {
#if !defined(FLOWSIM_WITH_LUAJIT)
    (void)function_name;
    return false;
#else
    if (lua_state_ == nullptr) {
        return false;
    }

    lua_getglobal(lua_state_, function_name);
    const bool is_function = lua_isfunction(lua_state_, -1);
    lua_pop(lua_state_, 1);
    return is_function;
#endif
}

}  // namespace flowsim::script
