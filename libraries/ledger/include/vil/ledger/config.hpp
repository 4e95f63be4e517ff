#pragma once

#include <stdint.h>

/** @file vil/ledger/config.hpp
 *  @brief Defines global constants that determine ledger behavior
 */

/**
 *  Changing any of these values changes every root the ledger
 *  produces and invalidates previously published proofs.
 */
#define VIL_EMPTY_ROOT_SEED                                 "empty"
#define VIL_LEAF_HASH_PREFIX                                uint8_t(0x00)
#define VIL_NODE_HASH_PREFIX                                uint8_t(0x01)

/**
 *  Upper bounds applied when an entry is validated, before it is hashed.
 */
#define VIL_MAX_ENTRY_ID_SIZE                               128
#define VIL_MAX_NULLIFIER_SIZE                              256
#define VIL_DEFAULT_MAX_FIELD_SIZE                          (1024*1024)
#define VIL_MAX_LEDGER_ENTRIES                              uint32_t(0xffffffff - 1)

#define VIL_CONFIRMATION_CODE_BYTES                         8

/** separates election and question ids in a per-question nullifier scope */
#define VIL_SCOPE_SEPARATOR                                 "/"
