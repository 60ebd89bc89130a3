#pragma once
#include <stdint.h>

#include "zm/panic.h"
#include "zm/zm_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Header fields consumed by the interpreter (V3 offsets).
   */
  typedef struct ZmHeader
  {
    uint8_t version;       /**< 0x00 */
    uint8_t flags1;        /**< 0x01, bit 1: status line shows time */
    zm_u16 high_base;      /**< 0x04 */
    zm_u16 initial_pc;     /**< 0x06 */
    zm_u16 dictionary;     /**< 0x08 */
    zm_u16 object_table;   /**< 0x0A */
    zm_u16 globals;        /**< 0x0C */
    zm_u16 static_base;    /**< 0x0E */
    zm_u16 abbreviations;  /**< 0x18 */
    zm_u32 file_length;    /**< 0x1A, stored in words */
    zm_u16 checksum;       /**< 0x1C */
  } ZmHeader;

  /**
   * @brief One routine activation.
   *
   * The evaluation stack is shared; a frame owns the window
   * [stack_base, sp) and cannot see below it.
   */
  typedef struct ZmFrame
  {
    zm_u32 return_pc;  /**< Where the caller resumes */
    zm_u32 routine;    /**< Byte address of the routine header (0 for main) */
    zm_u16 locals[15]; /**< Local variables 1-15 */
    uint8_t num_locals;
    uint8_t store_var; /**< Caller's result variable */
    uint8_t discard;   /**< Non-zero: drop the result */
    uint8_t arg_count;
    uint16_t stack_base;
  } ZmFrame;

  /**
   * @brief Dictionary layout, read once at load time.
   */
  typedef struct ZmDictionary
  {
    zm_u32 addr;
    uint8_t separator_count;
    uint8_t separators[32];
    uint8_t entry_length;
    uint16_t entry_count;
    uint8_t sorted;  /**< Count word was positive: entries are in key order */
    zm_u32 entries; /**< Address of the first entry */
  } ZmDictionary;

  /**
   * @brief State behind the `random` opcode.
   */
  typedef struct ZmRandom
  {
    uint32_t state;     /**< xorshift32 state (never 0) */
    uint16_t seq_range; /**< Non-zero: sequential mode over 1..seq_range */
    uint16_t seq_next;
  } ZmRandom;

  /**
   * @brief Output stream 3 redirection entry.
   */
  typedef struct ZmMemStream
  {
    zm_u16 table;
    zm_u16 count;
  } ZmMemStream;

  /**
   * @brief Internal interpreter structure (not part of the public API).
   *        Visible only for unit tests or tightly coupled components.
   */
  typedef struct Machine
  {
    /* Address space (interpreter-owned copy of the story) */
    uint8_t *mem;
    zm_u32 mem_size;
    ZmHeader header;
    zm_u16 checksum; /**< Computed over the image as loaded */

    /* Evaluation stack shared by all frames */
    enum
    {
      ZM_STACK_SIZE = 1024
    };
    zm_u16 stack[ZM_STACK_SIZE];
    int sp; /**< Next push position */

    /* Call frames; frames[0] is the main routine */
    enum
    {
      ZM_MAX_FRAMES = 256
    };
    ZmFrame frames[ZM_MAX_FRAMES];
    int frame_count;

    zm_u32 pc;      /**< Next instruction */
    zm_u32 op_pc;   /**< Start of the instruction being executed */

    /* Tables derived from the header */
    ZmDictionary dict;
    uint16_t object_count;

    ZmRandom rng;

    /* Output streams */
    uint8_t screen_enabled;
    enum
    {
      ZM_MAX_MEM_STREAMS = 16
    };
    ZmMemStream mem_streams[ZM_MAX_MEM_STREAMS];
    int mem_stream_depth;

    /* Host and diagnostics */
    ZmHost host;
    ZmPanicHandler panic_handler;
    void *panic_user_data;
    ZmTraceFn trace_fn;
    void *trace_user;

    /* Execution state */
    zm_err last_err; /**< Latched fatal error (0 = OK) */
    uint8_t quit;
    uint8_t input_pending; /**< sread suspended; status line already shown */
  } Machine;

#ifdef __cplusplus
} /* extern "C" */
#endif
