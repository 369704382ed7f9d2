// Stable C ABI of the EC2 compute provider plugin.
// All strings are UTF-8. Strings returned as char* belong to the caller and are
// released with cumulus_cpi_free_string; const char* results live as long as the
// extension handle.

#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define CUMULUS_CPI_ABI_VERSION 1u

typedef struct cumulus_cpi_extension cumulus_cpi_extension_t;

uint32_t cumulus_cpi_abi_version(void);

// config_json may be NULL or a JSON object overriding environment settings.
// Returns NULL on failure; *error_out (if given) then receives a message to free.
cumulus_cpi_extension_t* cumulus_cpi_create(const char* config_json, char** error_out);

void cumulus_cpi_destroy(cumulus_cpi_extension_t* ext);

const char* cumulus_cpi_name(const cumulus_cpi_extension_t* ext);
const char* cumulus_cpi_provider_type(const cumulus_cpi_extension_t* ext);

// JSON array of action names
char* cumulus_cpi_list_actions(const cumulus_cpi_extension_t* ext);

// JSON action definition, NULL for unknown actions
char* cumulus_cpi_describe_action(const cumulus_cpi_extension_t* ext, const char* action);

// Runs one action. params_json may be NULL. Always returns a result document
// unless ext or action is NULL.
char* cumulus_cpi_dispatch(cumulus_cpi_extension_t* ext, const char* action, const char* params_json);

void cumulus_cpi_free_string(char* str);

#ifdef __cplusplus
}
#endif
