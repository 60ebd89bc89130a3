#pragma once
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Basic typedefs                                                            */
  /* ------------------------------------------------------------------------- */

  /** 8-bit unsigned integer used for story bytes. */
  typedef uint8_t zm_u8;
  /** 16-bit unsigned word, the Z-machine's native value. */
  typedef uint16_t zm_u16;
  /** 16-bit signed view of a word, used by arithmetic opcodes. */
  typedef int16_t zm_i16;
  /** 32-bit unsigned integer for byte addresses (packed addresses expand past 64K). */
  typedef uint32_t zm_u32;
  /** Error code type. 0 = OK, negative = error. */
  typedef int zm_err;

  /* ------------------------------------------------------------------------- */
  /* Host I/O surface                                                          */
  /* ------------------------------------------------------------------------- */

/** read_line result: no line available yet, suspend the interpreter. */
#define ZM_HOST_PENDING (-1)
/** read_line result: input is exhausted. */
#define ZM_HOST_EOF (-2)
/** read_line result: the device failed. */
#define ZM_HOST_ERROR (-3)

  /**
   * @brief Callback table through which the interpreter talks to its host.
   *
   * print and read_line are required; the rest may be NULL.
   * All text is UTF-8. A newline is delivered as "\n" inside print().
   */
  typedef struct ZmHost
  {
    /** Emit a fragment of decoded output text. */
    void (*print)(void *user, const char *text, size_t len);

    /**
     * Read one line of player input into buf (no terminator needed).
     * @return Number of bytes stored, ZM_HOST_PENDING, ZM_HOST_EOF or ZM_HOST_ERROR.
     */
    int (*read_line)(void *user, char *buf, size_t cap);

    /**
     * Update the V3 status line.
     * @param location  Short name of the location object.
     * @param a         Score, or hours when is_time is set.
     * @param b         Moves, or minutes when is_time is set.
     */
    void (*show_status)(void *user, const char *location, zm_i16 a, zm_i16 b,
                        int is_time);

    void (*split_window)(void *user, int lines);
    void (*set_window)(void *user, int window);

    /** Output mirrored to the transcript (stream 2). */
    void (*transcript)(void *user, const char *text, size_t len);

    /** Non-deterministic seed source for `random 0`. */
    uint32_t (*entropy)(void *user);

    void *user; /**< Passed back to every callback */
  } ZmHost;

  /* ------------------------------------------------------------------------- */
  /* Interpreter configuration                                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Configuration structure used when creating an interpreter.
   *
   * The story image is copied; the caller keeps ownership of its buffer.
   */
  typedef struct ZmConfig
  {
    const uint8_t *story; /**< Story file image */
    zm_u32 story_size;    /**< Image size in bytes */
    ZmHost host;          /**< Host callbacks */
    int32_t random_seed;  /**< 0 = host entropy, otherwise deterministic seed */
    int verify_checksum;  /**< Reject images whose header checksum does not match */
    uint8_t screen_rows;  /**< Reported in header byte 0x20 (0 = leave as is) */
    uint8_t screen_cols;  /**< Reported in header byte 0x21 (0 = leave as is) */
  } ZmConfig;

  /* Forward declaration for the opaque interpreter. */
  struct Machine;

  /* ------------------------------------------------------------------------- */
  /* Step results                                                              */
  /* ------------------------------------------------------------------------- */

#define ZM_STEP_OK 0    /**< Instruction executed, keep going */
#define ZM_STEP_INPUT 1 /**< Waiting for a line from the host */
#define ZM_STEP_QUIT 2  /**< Story executed `quit` */

  /* ------------------------------------------------------------------------- */
  /* Lifecycle and execution                                                   */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Create an interpreter for a version 3 story image.
   * @param cfg  Pointer to a valid ZmConfig.
   * @param out  Receives the new interpreter on success.
   * @return 0 on success, negative error code (StoryFormat, UnsupportedVersion,
   *         ChecksumMismatch, InvalidArg) on failure.
   */
  zm_err zm_create(const ZmConfig *cfg, struct Machine **out);

  /**
   * @brief Destroy an interpreter and free its resources.
   * @param vm  Interpreter to destroy (NULL-safe).
   */
  void zm_destroy(struct Machine *vm);

  /**
   * @brief Decode and execute one instruction.
   * @return ZM_STEP_OK, ZM_STEP_INPUT, ZM_STEP_QUIT or a negative error code.
   */
  zm_err zm_step(struct Machine *vm);

  /**
   * @brief Run until the story quits, waits for input or fails.
   *
   * Fatal errors are reported through zm_panic() before returning.
   * After ZM_STEP_INPUT, call again once the host has a line ready.
   *
   * @return ZM_STEP_INPUT, ZM_STEP_QUIT or a negative error code.
   */
  zm_err zm_run(struct Machine *vm);

  /* ------------------------------------------------------------------------- */
  /* Direct memory access (for tests/embedding)                                */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Read a byte from the story address space.
   * @return 0 on success, OobMemory outside the image.
   */
  zm_err zm_mem_read8(struct Machine *vm, zm_u32 addr, zm_u8 *out);

  /**
   * @brief Read a big-endian word from the story address space.
   * @return 0 on success, OobMemory outside the image.
   */
  zm_err zm_mem_read16(struct Machine *vm, zm_u32 addr, zm_u16 *out);

  /**
   * @brief Write a byte with the same checks the story's own writes get.
   * @return 0 on success, OobMemory or ReadOnly.
   */
  zm_err zm_mem_write8(struct Machine *vm, zm_u32 addr, zm_u8 val);

  /**
   * @brief Write a big-endian word with the same checks the story's own writes get.
   * @return 0 on success, OobMemory or ReadOnly.
   */
  zm_err zm_mem_write16(struct Machine *vm, zm_u32 addr, zm_u16 val);

  /* ------------------------------------------------------------------------- */
  /* Variables                                                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Read variable 0-255 (0 pops the evaluation stack).
   */
  zm_err zm_var_read(struct Machine *vm, zm_u8 var, zm_u16 *out);

  /**
   * @brief Write variable 0-255 (0 pushes onto the evaluation stack).
   */
  zm_err zm_var_write(struct Machine *vm, zm_u8 var, zm_u16 val);

  /* ------------------------------------------------------------------------- */
  /* Inspection                                                                */
  /* ------------------------------------------------------------------------- */

  /** Current program counter (byte address). */
  zm_u32 zm_pc(struct Machine *vm);

  /** Number of values on the current frame's evaluation stack. */
  int zm_stack_depth(struct Machine *vm);

  /** Number of active routine frames (the main routine counts as one). */
  int zm_frame_depth(struct Machine *vm);

  /** Number of objects in the story's object table. */
  int zm_object_count(struct Machine *vm);

  /** Error latched by the last failed step, 0 if none. */
  zm_err zm_last_error(struct Machine *vm);

  /**
   * @brief Format the instruction at addr as one line of text.
   * @return Length written (excluding NUL), or a negative error code.
   */
  int zm_disassemble(struct Machine *vm, zm_u32 addr, char *buf, size_t cap);

  /**
   * @brief Per-instruction trace hook (NULL disables).
   *
   * Receives the disassembly of every instruction before it executes.
   */
  typedef void (*ZmTraceFn)(void *user, const char *line);
  void zm_set_trace(struct Machine *vm, ZmTraceFn fn, void *user);

  /* ------------------------------------------------------------------------- */
  /* Version and error handling                                                */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Get the interpreter version.
   * @return Version number as an integer.
   */
  int zm_version(void);

  /** Human-readable message for an error code. */
  const char *zm_err_str(zm_err e);

  /**
   * All public APIs return 0 (or a non-negative status) on success and a
   * negative zm_err on failure. Errors are defined in `errors.def`.
   *
   * Exceptions are never thrown (compiled with -fno-exceptions).
   * Every error raised while executing story code is fatal: the interpreter
   * latches it and keeps returning it.
   */

#ifdef __cplusplus
} /* extern "C" */
#endif
