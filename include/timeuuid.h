/*
  Copyright (c) DataStax, Inc.

  Licensed under the Apache License, Version 2.0 (the "License");
  you may not use this file except in compliance with the License.
  You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
*/

#ifndef __TIMEUUID_H_INCLUDED__
#define __TIMEUUID_H_INCLUDED__

#include <stddef.h>

#if !defined(TIMEUUID_STATIC)
#  if (defined(WIN32) || defined(_WIN32))
#    if defined(TIMEUUID_BUILDING)
#      define TIMEUUID_EXPORT __declspec(dllexport)
#    else
#      define TIMEUUID_EXPORT __declspec(dllimport)
#    endif
#  elif (defined(__GNUC__) && __GNUC__ >= 4) || defined(__INTEL_COMPILER)
#    define TIMEUUID_EXPORT __attribute__ ((visibility("default")))
#  else
#    define TIMEUUID_EXPORT
#  endif
#else
#define TIMEUUID_EXPORT
#endif

/**
 * @file include/timeuuid.h
 *
 * Generator for RFC 4122 version 1 (time-based) UUIDs. Generators either
 * serialize callers on a mutex or hand out values minted ahead of time by
 * a dedicated producer thread.
 */

#define TIMEUUID_VERSION_MAJOR 1
#define TIMEUUID_VERSION_MINOR 0
#define TIMEUUID_VERSION_PATCH 0
#define TIMEUUID_VERSION_SUFFIX ""

#ifdef __cplusplus
extern "C" {
#endif

typedef unsigned char timeuuid_uint8_t;
typedef unsigned short timeuuid_uint16_t;

#if defined(__INT64_TYPE__) && defined(__UINT64_TYPE__)
typedef __UINT64_TYPE__ timeuuid_uint64_t;
#elif defined(_MSC_VER)
typedef unsigned __int64 timeuuid_uint64_t;
#else
typedef unsigned long long timeuuid_uint64_t;
#endif

/**
 * The size of a hexadecimal UUID string including a null terminator.
 */
#define TIMEUUID_STRING_LENGTH 37

/**
 * The number of bytes in a UUID.
 */
#define TIMEUUID_LENGTH 16

/**
 * A version 1 (time-based) UUID laid out in network byte order.
 *
 * bytes[0:4] hold the low 32 bits of the timestamp, bytes[4:6] the middle
 * 16 bits, bytes[6:8] the high bits with the version in the top nibble,
 * bytes[8:10] the clock sequence with the variant in the top two bits and
 * bytes[10:16] the node.
 *
 * @struct TimeUuid
 */
typedef struct TimeUuid_ {
  timeuuid_uint8_t bytes[TIMEUUID_LENGTH];
} TimeUuid;

/**
 * A UUID generator. Generators are thread-safe whatever their strategy.
 *
 * @struct TimeUuidGen
 */
typedef struct TimeUuidGen_ TimeUuidGen;

/**
 * Settings used to construct a UUID generator.
 *
 * @struct TimeUuidConfig
 */
typedef struct TimeUuidConfig_ TimeUuidConfig;

typedef enum TimeUuidGenStrategy_ {
  TIMEUUID_GEN_STRATEGY_MUTEX, /**< Callers compute UUIDs under a lock */
  TIMEUUID_GEN_STRATEGY_QUEUE  /**< A producer thread feeds callers over a queue */
} TimeUuidGenStrategy;

#define TIMEUUID_LOG_LEVEL_MAPPING(XX) \
  XX(TIMEUUID_LOG_DISABLED, "") \
  XX(TIMEUUID_LOG_CRITICAL, "CRITICAL") \
  XX(TIMEUUID_LOG_ERROR, "ERROR") \
  XX(TIMEUUID_LOG_WARN, "WARN") \
  XX(TIMEUUID_LOG_INFO, "INFO") \
  XX(TIMEUUID_LOG_DEBUG, "DEBUG") \
  XX(TIMEUUID_LOG_TRACE, "TRACE")

typedef enum TimeUuidLogLevel_ {
#define XX_LOG(log_level, _) log_level,
  TIMEUUID_LOG_LEVEL_MAPPING(XX_LOG)
#undef XX_LOG
  /* @cond IGNORE */
  TIMEUUID_LOG_LAST_ENTRY
  /* @endcond */
} TimeUuidLogLevel;

#define TIMEUUID_ERROR_MAPPING(XX) \
  XX(TIMEUUID_ERROR_LIB_BAD_PARAMS, 1, "Bad parameters") \
  XX(TIMEUUID_ERROR_LIB_UNABLE_TO_INIT, 2, "Unable to initialize") \
  XX(TIMEUUID_ERROR_LIB_INVALID_STATE, 3, "Invalid state")

typedef enum TimeUuidError_ {
  TIMEUUID_OK = 0,
#define XX_ERROR(name, code, _) name = code,
  TIMEUUID_ERROR_MAPPING(XX_ERROR)
#undef XX_ERROR
  /* @cond IGNORE */
  TIMEUUID_ERROR_LAST_ENTRY
  /* @endcond*/
} TimeUuidError;

/**
 * Maximum size of a log message
 */
#define TIMEUUID_LOG_MAX_MESSAGE_SIZE 1024

/**
 * A log message.
 */
typedef struct TimeUuidLogMessage_ {
  /**
   * The millisecond timestamp (since the Epoch) when the message was logged
   */
  timeuuid_uint64_t time_ms;
  TimeUuidLogLevel severity; /**< The severity of the log message */
  const char* file; /**< The file where the message was logged */
  int line; /**< The line in the file where the message was logged */
  const char* function; /**< The function where the message was logged */
  char message[TIMEUUID_LOG_MAX_MESSAGE_SIZE]; /**< The message */
} TimeUuidLogMessage;

/**
 * A callback that's used to handle logging.
 *
 * @param[in] message
 * @param[in] data user defined data provided when the callback
 * was registered.
 *
 * @see timeuuid_log_set_callback();
 */
typedef void (*TimeUuidLogCallback)(const TimeUuidLogMessage* message,
                                    void* data);

/***********************************************************************************
 *
 * Config
 *
 ***********************************************************************************/

/**
 * Creates a new generator configuration with the defaults: mutex strategy,
 * queue size of 0 and a node taken from the network interfaces.
 *
 * @public @memberof TimeUuidConfig
 *
 * @return Returns a config that must be freed.
 *
 * @see timeuuid_config_free()
 */
TIMEUUID_EXPORT TimeUuidConfig*
timeuuid_config_new();

/**
 * Frees a config instance.
 *
 * @public @memberof TimeUuidConfig
 *
 * @param[in] config
 */
TIMEUUID_EXPORT void
timeuuid_config_free(TimeUuidConfig* config);

/**
 * Sets the strategy used to synchronize access to the generator state.
 *
 * <b>Default:</b> TIMEUUID_GEN_STRATEGY_MUTEX
 *
 * @public @memberof TimeUuidConfig
 *
 * @param[in] config
 * @param[in] strategy
 * @return TIMEUUID_OK if successful, otherwise an error occurred.
 */
TIMEUUID_EXPORT TimeUuidError
timeuuid_config_set_strategy(TimeUuidConfig* config,
                             TimeUuidGenStrategy strategy);

/**
 * Sets the number of UUIDs the producer thread of a queue generator mints
 * ahead of demand. A size of 0 hands each UUID over directly to a waiting
 * caller.
 *
 * <b>Default:</b> 0
 *
 * @public @memberof TimeUuidConfig
 *
 * @param[in] config
 * @param[in] queue_size
 * @return TIMEUUID_OK if successful, otherwise an error occurred.
 */
TIMEUUID_EXPORT TimeUuidError
timeuuid_config_set_queue_size(TimeUuidConfig* config,
                               size_t queue_size);

/**
 * Sets an explicit node instead of a hardware address. Only the lower 48
 * bits are used.
 *
 * @public @memberof TimeUuidConfig
 *
 * @param[in] config
 * @param[in] node
 * @return TIMEUUID_OK if successful, otherwise an error occurred.
 */
TIMEUUID_EXPORT TimeUuidError
timeuuid_config_set_node(TimeUuidConfig* config,
                         timeuuid_uint64_t node);

/***********************************************************************************
 *
 * Generator
 *
 ***********************************************************************************/

/**
 * Creates a generator that serializes callers on a mutex.
 *
 * @public @memberof TimeUuidGen
 *
 * @return Returns a generator that must be freed, or NULL if no secure
 * random data was available to initialize it.
 *
 * @see timeuuid_gen_free()
 */
TIMEUUID_EXPORT TimeUuidGen*
timeuuid_gen_mutex_new();

/**
 * Creates a generator backed by a dedicated producer thread.
 *
 * @public @memberof TimeUuidGen
 *
 * @param[in] queue_size Number of UUIDs produced ahead of demand
 * (0 for a direct hand-off).
 * @return Returns a generator that must be freed, or NULL if it could not
 * be initialized.
 *
 * @see timeuuid_gen_free()
 */
TIMEUUID_EXPORT TimeUuidGen*
timeuuid_gen_queue_new(size_t queue_size);

/**
 * Creates a generator from a config.
 *
 * @public @memberof TimeUuidGen
 *
 * @param[in] config
 * @param[out] output A generator that must be freed.
 * @return TIMEUUID_OK if successful, otherwise an error occurred.
 */
TIMEUUID_EXPORT TimeUuidError
timeuuid_gen_new_with_config(const TimeUuidConfig* config,
                             TimeUuidGen** output);

/**
 * Frees a generator instance. A producer thread is stopped and joined.
 *
 * @public @memberof TimeUuidGen
 *
 * @param[in] uuid_gen
 */
TIMEUUID_EXPORT void
timeuuid_gen_free(TimeUuidGen* uuid_gen);

/**
 * Generates a V1 (time) UUID.
 *
 * @public @memberof TimeUuidGen
 *
 * @param[in] uuid_gen
 * @param[out] output A V1 UUID for the current time.
 */
TIMEUUID_EXPORT void
timeuuid_gen_next(TimeUuidGen* uuid_gen,
                  TimeUuid* output);

/***********************************************************************************
 *
 * Process-wide generators
 *
 ***********************************************************************************/

/**
 * Initializes the process-wide generators: one guarded by a mutex and one
 * fed by a producer thread. Only the first call does any work; later calls
 * return its result.
 *
 * @return TIMEUUID_OK if successful, otherwise an error occurred.
 */
TIMEUUID_EXPORT TimeUuidError
timeuuid_global_init();

/**
 * Generates a V1 UUID from the process-wide mutex guarded generator.
 *
 * @param[out] output
 * @return TIMEUUID_OK if successful, TIMEUUID_ERROR_LIB_INVALID_STATE if
 * timeuuid_global_init() has not succeeded.
 */
TIMEUUID_EXPORT TimeUuidError
timeuuid_global_next(TimeUuid* output);

/**
 * Generates a V1 UUID from the process-wide producer thread without taking
 * a lock on the generator state.
 *
 * @param[out] output
 * @return TIMEUUID_OK if successful, TIMEUUID_ERROR_LIB_INVALID_STATE if
 * timeuuid_global_init() has not succeeded.
 */
TIMEUUID_EXPORT TimeUuidError
timeuuid_global_next_lock_free(TimeUuid* output);

/***********************************************************************************
 *
 * UUID
 *
 ***********************************************************************************/

/**
 * Sets the version nibble of a UUID.
 *
 * @param[in,out] uuid
 * @param[in] version
 */
TIMEUUID_EXPORT void
timeuuid_set_version(TimeUuid* uuid,
                     timeuuid_uint8_t version);

/**
 * Sets the RFC 4122 variant bits of a UUID.
 *
 * @param[in,out] uuid
 */
TIMEUUID_EXPORT void
timeuuid_set_variant(TimeUuid* uuid);

/**
 * Gets the version for a UUID
 *
 * @param[in] uuid
 * @return The version number (1 for time-based UUIDs)
 */
TIMEUUID_EXPORT timeuuid_uint8_t
timeuuid_version(TimeUuid uuid);

/**
 * Gets the timestamp for a V1 UUID
 *
 * @param[in] uuid
 * @return The timestamp in milliseconds since the Epoch
 * (00:00:00 UTC on 1 January 1970).
 */
TIMEUUID_EXPORT timeuuid_uint64_t
timeuuid_timestamp(TimeUuid uuid);

/**
 * Gets the clock sequence for a V1 UUID with the variant bits cleared.
 *
 * @param[in] uuid
 * @return The 14-bit clock sequence.
 */
TIMEUUID_EXPORT timeuuid_uint16_t
timeuuid_clock_seq(TimeUuid uuid);

/**
 * Returns a null-terminated string for the specified UUID.
 *
 * @param[in] uuid
 * @param[out] output A null-terminated string of length TIMEUUID_STRING_LENGTH.
 */
TIMEUUID_EXPORT void
timeuuid_string(TimeUuid uuid,
                char* output);

/***********************************************************************************
 *
 * Error
 *
 ***********************************************************************************/

/**
 * Gets a description for an error code.
 *
 * @param[in] error
 * @return A null-terminated string describing the error.
 */
TIMEUUID_EXPORT const char*
timeuuid_error_desc(TimeUuidError error);

/***********************************************************************************
 *
 * Log
 *
 ***********************************************************************************/

/**
 * Sets the log level.
 *
 * <b>Note:</b> This needs to be done before any call that might log, such as
 * any of the timeuuid_gen_*() or timeuuid_global_*() functions.
 *
 * <b>Default:</b> TIMEUUID_LOG_WARN
 *
 * @param[in] log_level
 */
TIMEUUID_EXPORT void
timeuuid_log_set_level(TimeUuidLogLevel log_level);

/**
 * Sets a callback for handling logging events.
 *
 * <b>Note:</b> This needs to be done before any call that might log.
 *
 * <b>Default:</b> An internal callback that prints to stderr
 *
 * @param[in] callback A callback that handles logging events. This is
 * called from whichever thread logs, including producer threads. Passing
 * NULL disables logging output.
 * @param[in] data An opaque data object passed to the callback.
 */
TIMEUUID_EXPORT void
timeuuid_log_set_callback(TimeUuidLogCallback callback,
                          void* data);

/**
 * Gets the string for a log level.
 *
 * @param[in] log_level
 * @return A null-terminated string for the log level.
 * Example: "ERROR", "WARN", "INFO", etc.
 */
TIMEUUID_EXPORT const char*
timeuuid_log_level_string(TimeUuidLogLevel log_level);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* __TIMEUUID_H_INCLUDED__ */
