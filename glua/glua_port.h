/*

# Instructions

This is the port file for glua-bridge. Every setting below may be overridden
by defining the macro before the first glua header is included (for example
with a `-D` compiler flag), so modules do not need to edit this file.

*/
#pragma once

#include <stdio.h>

/**
 * The version of the port interface that this file is implementing.
 */
#define GLUA_PORT_VERSION 1

/**
 * Largest integer magnitude that the VM's double-precision numbers represent
 * exactly (2^53 - 1). Integers beyond it are pushed as base-10 strings.
 */
#ifndef GLUA_MAX_SAFE_INTEGER
#define GLUA_MAX_SAFE_INTEGER 9007199254740991LL
#endif

/**
 * Prefix of the timer that drains the task queue. The full name also carries
 * a random suffix and the address of the queue so that several modules can
 * be loaded into the same VM.
 */
#ifndef GLUA_THINK_TIMER_PREFIX
#define GLUA_THINK_TIMER_PREFIX "_GLUA_THINK_"
#endif

#ifndef GLUA_THINK_TIMER_RANDOM_LENGTH
#define GLUA_THINK_TIMER_RANDOM_LENGTH 10
#endif

/**
 * The VM stores closure upvalue counts in a byte.
 */
#define GLUA_MAX_CLOSURE_UPVALUES 255

/**
 * Set to 1 to make `GLUA_STACK_GUARD` verify stack hygiene at scope exit.
 * Enabled by default in debug builds.
 */
#ifndef GLUA_PORT_STACK_GUARD
  #ifdef NDEBUG
    #define GLUA_PORT_STACK_GUARD 0
  #else
    #define GLUA_PORT_STACK_GUARD 1
  #endif
#endif

/**
 * Called when the bridge cannot continue at all (the host runtime library or
 * one of its symbols is missing). Must not return.
 */
#ifndef GLUA_FATAL_ERROR
#define GLUA_FATAL_ERROR(message) GLua::fatalError(message)
#endif

/**
 * Last-resort error output, used when the VM's own error reporting globals
 * are unavailable.
 */
#ifndef GLUA_LOG_ERROR
#define GLUA_LOG_ERROR(message) fprintf(stderr, "[ERROR] %s\n", (message))
#endif
