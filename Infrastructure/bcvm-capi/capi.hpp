#pragma once
#include <cstddef>
#include <cstdint>

#if defined(_WIN32)
  #define BCVM_API __declspec(dllexport)
#else
  #define BCVM_API __attribute__((visibility("default")))
#endif

extern "C" {
  // Loads and runs a module with the base library installed. Returns 0 on
  // success with *out_json holding the JSON array of returned values; on failure
  // *out_error holds the message. Both strings are released with bcvm_free.
  // settings_json may be null.
  BCVM_API int bcvm_run_bytecode(const uint8_t* bytes, size_t size, const char* settings_json, char** out_json, char** out_error);
  // Deserializes only. *out_json receives the module dump.
  BCVM_API int bcvm_check_bytecode(const uint8_t* bytes, size_t size, char** out_json, char** out_error);
  BCVM_API void bcvm_free(char* ptr);
}
