#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define FLOWSIM_NATIVE_ABI_VERSION 1

#if defined(__GNUC__)
#define FLOWSIM_NATIVE_EXPORT __attribute__((visibility("default")))
#else
#define FLOWSIM_NATIVE_EXPORT
#endif

typedef struct flowsim_native_instance flowsim_native_instance;

typedef struct flowsim_native_options {
    const char* network_name;
    const char* template_path;
    const char* subnetwork_name;
    const char* replication_name;
    const char* centroid_config_name;
    /* NULL when no emission output is wanted. */
    const char* emission_file;
    double sim_step;
    int32_t render;
    int32_t seed;
} flowsim_native_options;

typedef struct flowsim_native_step_result {
    double simulation_time;
    int32_t departed;
    int32_t arrived;
    int32_t terminal;
} flowsim_native_step_result;

typedef struct flowsim_native_vehicle {
    const char* id;
    const char* edge_id;
    double speed;
    double lane_position;
    double x;
    double y;
} flowsim_native_vehicle;

/* Functions returning int32_t report 0 on success and non-zero on failure,
   with a message available from flowsim_native_last_error. Strings handed
   out by the module stay valid until the next call on the same instance. */
typedef int32_t (*flowsim_native_abi_version_fn)(void);
typedef flowsim_native_instance* (*flowsim_native_create_fn)(const flowsim_native_options* options);
typedef void (*flowsim_native_destroy_fn)(flowsim_native_instance* instance);
typedef const char* (*flowsim_native_last_error_fn)(const flowsim_native_instance* instance);
typedef int32_t (*flowsim_native_load_network_fn)(flowsim_native_instance* instance);
typedef int32_t (*flowsim_native_reset_fn)(flowsim_native_instance* instance);
typedef int32_t (*flowsim_native_step_fn)(
    flowsim_native_instance* instance,
    double step_size,
    flowsim_native_step_result* out_result);
typedef int32_t (*flowsim_native_vehicle_count_fn)(const flowsim_native_instance* instance);
typedef int32_t (*flowsim_native_vehicle_at_fn)(
    const flowsim_native_instance* instance,
    int32_t index,
    flowsim_native_vehicle* out_vehicle);
typedef int32_t (*flowsim_native_set_speed_fn)(
    flowsim_native_instance* instance,
    const char* vehicle_id,
    double speed);

FLOWSIM_NATIVE_EXPORT int32_t flowsim_native_abi_version(void);
FLOWSIM_NATIVE_EXPORT flowsim_native_instance* flowsim_native_create(
    const flowsim_native_options* options);
FLOWSIM_NATIVE_EXPORT void flowsim_native_destroy(flowsim_native_instance* instance);
FLOWSIM_NATIVE_EXPORT const char* flowsim_native_last_error(const flowsim_native_instance* instance);
FLOWSIM_NATIVE_EXPORT int32_t flowsim_native_load_network(flowsim_native_instance* instance);
FLOWSIM_NATIVE_EXPORT int32_t flowsim_native_reset(flowsim_native_instance* instance);
FLOWSIM_NATIVE_EXPORT int32_t flowsim_native_step(
    flowsim_native_instance* instance,
    double step_size,
    flowsim_native_step_result* out_result);
FLOWSIM_NATIVE_EXPORT int32_t flowsim_native_vehicle_count(const flowsim_native_instance* instance);
FLOWSIM_NATIVE_EXPORT int32_t flowsim_native_vehicle_at(
    const flowsim_native_instance* instance,
    int32_t index,
    flowsim_native_vehicle* out_vehicle);
FLOWSIM_NATIVE_EXPORT int32_t flowsim_native_set_speed(
    flowsim_native_instance* instance,
    const char* vehicle_id,
    double speed);

#ifdef __cplusplus
}
#endif
