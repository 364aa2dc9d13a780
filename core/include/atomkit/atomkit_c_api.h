/**
 * @file atomkit_c_api.h
 * @brief C-API for the atomkit atom codec.
 *
 * Lets plugin hosts and foreign-language runtimes (C, Rust, C#, Python
 * ctypes) forge and read atom buffers without touching C++ types.
 *
 * DESIGN INVARIANTS:
 *   1. All functions are `extern "C"` for flat ABI compatibility.
 *   2. All functions return `atomkit_error_t` (integer enum) for FFI safety.
 *   3. C++ exceptions NEVER cross the FFI boundary.
 *   4. Caller-allocated buffers: the forge writes into memory the caller
 *      owns, and text is copied out into caller arrays + capacity +
 *      out_length. Nothing is malloc'd inside and returned across FFI.
 *   5. Opaque pointer pattern: `atomkit_registry_t` and `atomkit_forge_t`
 *      hide all C++ internals.
 */

#ifndef ATOMKIT_C_API_H
#define ATOMKIT_C_API_H

#include <stddef.h>
#include <stdint.h>

/* ═══════════════════════════════════════════════════════════════════════════
 * DLL EXPORT MACRO
 * ═══════════════════════════════════════════════════════════════════════════
 * Windows hides shared library symbols by default; POSIX builds use
 * -fvisibility=hidden and re-export the API explicitly.
 */
#if defined(_WIN32) || defined(_WIN64)
#ifdef ATOMKIT_BUILDING_SHARED
#define ATOMKIT_API __declspec(dllexport)
#else
#define ATOMKIT_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define ATOMKIT_API __attribute__((visibility("default")))
#else
#define ATOMKIT_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ═══════════════════════════════════════════════════════════════════════════
 * ERROR CODES: atomkit_error_t
 *
 * Codec failures map one-to-one onto atomkit::AtomError; the remaining
 * codes cover argument validation at the boundary.
 * ═══════════════════════════════════════════════════════════════════════════
 */
typedef enum {
  ATOMKIT_OK = 0,                     /**< Success */
  ATOMKIT_ERR_NULL_PTR = -1,          /**< A required pointer was NULL */
  ATOMKIT_ERR_INVALID_ARG = -2,       /**< Argument out of range */
  ATOMKIT_ERR_OUT_OF_MEMORY = -3,     /**< Handle allocation failed */
  ATOMKIT_ERR_NOT_FOUND = -4,         /**< Id was never mapped */
  ATOMKIT_ERR_BUFFER_TOO_SMALL = -5,  /**< Caller buffer too small */
  ATOMKIT_ERR_OUT_OF_SPACE = -10,     /**< Forge buffer exhausted (sticky) */
  ATOMKIT_ERR_FRAME_UNDERFLOW = -11,  /**< pop with no open frame */
  ATOMKIT_ERR_FRAME_OVERFLOW = -12,   /**< Too many nested frames */
  ATOMKIT_ERR_FRAME_MISMATCH = -13,   /**< Operation illegal in this frame */
  ATOMKIT_ERR_TRUNCATED = -14,        /**< Atom runs past end of buffer */
  ATOMKIT_ERR_UNEXPECTED_TYPE = -15,  /**< Container vs scalar mix-up */
  ATOMKIT_ERR_MALFORMED = -16,        /**< Inconsistent container sizes */
  ATOMKIT_ERR_TYPE_MISMATCH = -17,    /**< Wrong kind of type id */
  ATOMKIT_ERR_UNKNOWN = -99           /**< Unknown internal error */
} atomkit_error_t;

/** Sequence time units for atomkit_forge_push_sequence(). */
typedef enum {
  ATOMKIT_UNIT_FRAMES = 0,
  ATOMKIT_UNIT_BEATS = 1
} atomkit_time_unit_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * OPAQUE HANDLES
 * ═══════════════════════════════════════════════════════════════════════════
 */

/** URI <-> id registry; also caches the standard atom type ids. */
typedef struct atomkit_registry_s atomkit_registry_t;

/** Writer bound to one caller-owned buffer. */
typedef struct atomkit_forge_s atomkit_forge_t;

/** Header of one atom as seen by the reader functions. */
typedef struct {
  uint32_t type;      /**< Registry id of the atom's type */
  uint32_t body_size; /**< Payload length (excludes header and padding) */
  size_t next_offset; /**< Offset of the next sibling atom */
} atomkit_header_t;

/** Returns the library version string (static storage). */
ATOMKIT_API const char *atomkit_version(void);

/* ═══════════════════════════════════════════════════════════════════════════
 * REGISTRY
 * ═══════════════════════════════════════════════════════════════════════════
 */

/**
 * @brief Creates an empty registry and maps the standard atom types.
 *
 * @param[out] out_registry Receives the handle.
 * @note Caller MUST call atomkit_registry_destroy() when done.
 */
ATOMKIT_API atomkit_error_t
atomkit_registry_create(atomkit_registry_t **out_registry);

/** Destroys a registry (NULL is a no-op). Forges created from it must be
 *  destroyed first. */
ATOMKIT_API atomkit_error_t
atomkit_registry_destroy(atomkit_registry_t *registry);

/**
 * @brief Maps a URI to its id, assigning a new one on first use.
 * @return ATOMKIT_ERR_INVALID_ARG for an empty URI.
 */
ATOMKIT_API atomkit_error_t atomkit_registry_map(atomkit_registry_t *registry,
                                                 const char *uri,
                                                 uint32_t *out_id);

/**
 * @brief Copies the URI of `id` into `buffer` (NUL-terminated).
 *
 * @param[out] out_length Length of the URI without its NUL; set even when
 *                        the buffer is too small.
 * @return ATOMKIT_ERR_NOT_FOUND for unknown ids,
 *         ATOMKIT_ERR_BUFFER_TOO_SMALL if capacity <= length.
 */
ATOMKIT_API atomkit_error_t atomkit_registry_unmap(
    const atomkit_registry_t *registry, uint32_t id, char *buffer,
    size_t capacity, size_t *out_length);

/* ═══════════════════════════════════════════════════════════════════════════
 * FORGE: lifecycle
 * ═══════════════════════════════════════════════════════════════════════════
 */

/**
 * @brief Creates a forge writing into `buffer[0, capacity)`.
 *
 * The buffer stays owned by the caller and must outlive the forge or be
 * replaced with atomkit_forge_reset().
 */
ATOMKIT_API atomkit_error_t atomkit_forge_create(atomkit_registry_t *registry,
                                                 uint8_t *buffer,
                                                 size_t capacity,
                                                 atomkit_forge_t **out_forge);

ATOMKIT_API atomkit_error_t atomkit_forge_destroy(atomkit_forge_t *forge);

/** Re-arms the forge over a (possibly new) buffer; clears any fault. */
ATOMKIT_API atomkit_error_t atomkit_forge_reset(atomkit_forge_t *forge,
                                                uint8_t *buffer,
                                                size_t capacity);

/** Bytes written so far, padding included. */
ATOMKIT_API atomkit_error_t atomkit_forge_size(const atomkit_forge_t *forge,
                                               size_t *out_size);

/** Number of open container frames. */
ATOMKIT_API atomkit_error_t atomkit_forge_depth(const atomkit_forge_t *forge,
                                                size_t *out_depth);

/* ═══════════════════════════════════════════════════════════════════════════
 * FORGE: values
 * ═══════════════════════════════════════════════════════════════════════════
 */

ATOMKIT_API atomkit_error_t atomkit_forge_write_int(atomkit_forge_t *forge,
                                                    int32_t value);
ATOMKIT_API atomkit_error_t atomkit_forge_write_long(atomkit_forge_t *forge,
                                                     int64_t value);
ATOMKIT_API atomkit_error_t atomkit_forge_write_float(atomkit_forge_t *forge,
                                                      float value);
ATOMKIT_API atomkit_error_t atomkit_forge_write_double(atomkit_forge_t *forge,
                                                       double value);
/** Any nonzero `value` is written as true. */
ATOMKIT_API atomkit_error_t atomkit_forge_write_bool(atomkit_forge_t *forge,
                                                     int value);
ATOMKIT_API atomkit_error_t atomkit_forge_write_urid(atomkit_forge_t *forge,
                                                     uint32_t value);
/** NUL-terminated UTF-8. */
ATOMKIT_API atomkit_error_t atomkit_forge_write_string(atomkit_forge_t *forge,
                                                       const char *text);

/* ═══════════════════════════════════════════════════════════════════════════
 * FORGE: containers
 * ═══════════════════════════════════════════════════════════════════════════
 */

ATOMKIT_API atomkit_error_t atomkit_forge_push_tuple(atomkit_forge_t *forge);

ATOMKIT_API atomkit_error_t atomkit_forge_push_object(atomkit_forge_t *forge,
                                                      uint32_t id,
                                                      uint32_t otype);

/** Pass child_type 0 to let the first scalar written lock the type. */
ATOMKIT_API atomkit_error_t atomkit_forge_push_vector(atomkit_forge_t *forge,
                                                      uint32_t child_type,
                                                      uint32_t child_size);

ATOMKIT_API atomkit_error_t
atomkit_forge_push_sequence(atomkit_forge_t *forge, atomkit_time_unit_t unit);

ATOMKIT_API atomkit_error_t atomkit_forge_write_property(atomkit_forge_t *forge,
                                                         uint32_t key,
                                                         uint32_t context);

ATOMKIT_API atomkit_error_t
atomkit_forge_write_frame_time(atomkit_forge_t *forge, int64_t frames);

ATOMKIT_API atomkit_error_t
atomkit_forge_write_beat_time(atomkit_forge_t *forge, double beats);

/** Appends `size` raw bytes; size must equal the vector's child_size. */
ATOMKIT_API atomkit_error_t
atomkit_forge_write_vector_element(atomkit_forge_t *forge, const void *data,
                                   size_t size);

/** Closes the innermost container. */
ATOMKIT_API atomkit_error_t atomkit_forge_pop(atomkit_forge_t *forge);

/* ═══════════════════════════════════════════════════════════════════════════
 * READER: stateless, bounds-checked reads of `buffer[0, length)`
 * ═══════════════════════════════════════════════════════════════════════════
 */

ATOMKIT_API atomkit_error_t
atomkit_read_header(const atomkit_registry_t *registry, const uint8_t *buffer,
                    size_t length, size_t offset, atomkit_header_t *out_header);

ATOMKIT_API atomkit_error_t atomkit_read_int(const atomkit_registry_t *registry,
                                             const uint8_t *buffer,
                                             size_t length, size_t offset,
                                             int32_t *out_value);

ATOMKIT_API atomkit_error_t
atomkit_read_long(const atomkit_registry_t *registry, const uint8_t *buffer,
                  size_t length, size_t offset, int64_t *out_value);

ATOMKIT_API atomkit_error_t
atomkit_read_float(const atomkit_registry_t *registry, const uint8_t *buffer,
                   size_t length, size_t offset, float *out_value);

ATOMKIT_API atomkit_error_t
atomkit_read_double(const atomkit_registry_t *registry, const uint8_t *buffer,
                    size_t length, size_t offset, double *out_value);

/**
 * @brief Copies a String atom's text into `out` (NUL-terminated).
 * @param[out] out_length Text length without NUL; set even when the
 *                        buffer is too small.
 */
ATOMKIT_API atomkit_error_t
atomkit_read_string(const atomkit_registry_t *registry, const uint8_t *buffer,
                    size_t length, size_t offset, char *out, size_t capacity,
                    size_t *out_length);

/**
 * @brief Counts the children of the Tuple at `offset`.
 * @return ATOMKIT_ERR_MALFORMED if any child overruns the tuple.
 */
ATOMKIT_API atomkit_error_t
atomkit_tuple_child_count(const atomkit_registry_t *registry,
                          const uint8_t *buffer, size_t length, size_t offset,
                          size_t *out_count);

#ifdef __cplusplus
}
#endif

#endif /* ATOMKIT_C_API_H */
