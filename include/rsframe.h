/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_H_INCLUDED__
#define __RSFRAME_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define RSFRAME_VERSION_MAJOR 0
#define RSFRAME_VERSION_MINOR 3
#define RSFRAME_VERSION_PATCH 0

#define RSFRAME_MAKE_VERSION(major, minor, patch)                              \
    ((major) *10000 + (minor) *100 + (patch))
#define RSFRAME_VERSION                                                        \
    RSFRAME_MAKE_VERSION (RSFRAME_VERSION_MAJOR, RSFRAME_VERSION_MINOR,        \
                          RSFRAME_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

/*  Handle DSO symbol visibility                                             */
#if defined RSFRAME_NO_EXPORT
#define RSFRAME_EXPORT
#else
#if defined _WIN32
#if defined RSFRAME_STATIC
#define RSFRAME_EXPORT
#elif defined DLL_EXPORT
#define RSFRAME_EXPORT __declspec(dllexport)
#else
#define RSFRAME_EXPORT __declspec(dllimport)
#endif
#else
#if (defined __GNUC__ && __GNUC__ >= 4) || defined __INTEL_COMPILER
#define RSFRAME_EXPORT __attribute__ ((visibility ("default")))
#else
#define RSFRAME_EXPORT
#endif
#endif
#endif

/******************************************************************************/
/*  rsframe errors.                                                           */
/******************************************************************************/
#define RSFRAME_HAUSNUMERO 156384912

#ifndef ENOTSUP
#define ENOTSUP (RSFRAME_HAUSNUMERO + 1)
#endif
#ifndef ENOBUFS
#define ENOBUFS (RSFRAME_HAUSNUMERO + 3)
#endif
#ifndef EMSGSIZE
#define EMSGSIZE (RSFRAME_HAUSNUMERO + 10)
#endif

#define EFSM (RSFRAME_HAUSNUMERO + 51)
#define EMALFORMED (RSFRAME_HAUSNUMERO + 60)
#define EUNKNOWNTYPE (RSFRAME_HAUSNUMERO + 61)
#define ENOMETADATA (RSFRAME_HAUSNUMERO + 62)
#define EDATANOTSUP (RSFRAME_HAUSNUMERO + 63)
#define EREQNNOTSUP (RSFRAME_HAUSNUMERO + 64)
#define EPAYLOADSIZE (RSFRAME_HAUSNUMERO + 65)
#define EINTERLEAVED (RSFRAME_HAUSNUMERO + 66)
#define EINCOMPLETE (RSFRAME_HAUSNUMERO + 67)

/**
 * @brief Return the errno for the current thread.
 * @return errno value (POSIX errno or RSFRAME_HAUSNUMERO-based extended code).
 */
RSFRAME_EXPORT int rsframe_errno (void);

/**
 * @brief Return a human-readable string for the given error number.
 * @param errnum_  Error number (e.g. return value of rsframe_errno()).
 * @return Static string pointer. Must not be modified or freed.
 */
RSFRAME_EXPORT const char *rsframe_strerror (int errnum_);

/**
 * @brief Return the runtime library version.
 */
RSFRAME_EXPORT void rsframe_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Wire constants.                                                           */
/******************************************************************************/
#define RSFRAME_HEADER_SIZE 6
#define RSFRAME_LENGTH_PREFIX_SIZE 3
#define RSFRAME_MAX_METADATA_SIZE 0xFFFFFF
#define RSFRAME_MAX_STREAM_ID 0x7FFFFFFF

/*  Frame types                                                               */
#define RSFRAME_TYPE_SETUP 0x01
#define RSFRAME_TYPE_LEASE 0x02
#define RSFRAME_TYPE_KEEPALIVE 0x03
#define RSFRAME_TYPE_REQUEST_RESPONSE 0x04
#define RSFRAME_TYPE_REQUEST_FNF 0x05
#define RSFRAME_TYPE_REQUEST_STREAM 0x06
#define RSFRAME_TYPE_REQUEST_CHANNEL 0x07
#define RSFRAME_TYPE_REQUEST_N 0x08
#define RSFRAME_TYPE_CANCEL 0x09
#define RSFRAME_TYPE_PAYLOAD 0x0A
#define RSFRAME_TYPE_ERROR 0x0B
#define RSFRAME_TYPE_METADATA_PUSH 0x0C
#define RSFRAME_TYPE_RESUME 0x0D
#define RSFRAME_TYPE_RESUME_OK 0x0E
#define RSFRAME_TYPE_EXT 0x3F

/*  Frame flags (low 10 bits of the type/flags field)                         */
#define RSFRAME_FLAG_IGNORE 0x200
#define RSFRAME_FLAG_METADATA 0x100
#define RSFRAME_FLAG_FOLLOWS 0x80
#define RSFRAME_FLAG_COMPLETE 0x40
#define RSFRAME_FLAG_NEXT 0x20
#define RSFRAME_FLAG_RESPOND 0x80
#define RSFRAME_FLAG_LEASE 0x40
#define RSFRAME_FLAG_RESUME_ENABLE 0x80
#define RSFRAME_FLAG_MASK 0x3FF

/******************************************************************************/
/*  Options for stateful components.                                          */
/******************************************************************************/
#define RSFRAME_MAX_FRAME_SIZE 1
#define RSFRAME_MAX_REASSEMBLY_SIZE 2
#define RSFRAME_INTERLEAVE_FRAGMENTS 3
#define RSFRAME_STRICT_STREAM_IDS 4

#define RSFRAME_MAX_FRAME_SIZE_DFLT 0xFFFFFF

/******************************************************************************/
/*  Frame header.                                                             */
/******************************************************************************/

/**
 * @brief Write a 6-byte frame header.
 * @return Number of bytes written (6), or -1 on failure (errno is set:
 *         EINVAL, EUNKNOWNTYPE or ENOBUFS).
 */
RSFRAME_EXPORT int rsframe_header_encode (
  void *buf_, size_t size_, uint32_t stream_id_, int type_, int flags_);

/**
 * @brief Parse a frame header.
 * @return 0 on success, -1 with errno EMALFORMED if the buffer is shorter
 *         than the header, the type code is unknown or the reserved
 *         stream id bit is set. Outputs are untouched on failure.
 */
RSFRAME_EXPORT int rsframe_header_decode (const void *buf_,
                                          size_t size_,
                                          uint32_t *stream_id_,
                                          int *type_,
                                          int *flags_);

/******************************************************************************/
/*  Frame type taxonomy.                                                      */
/******************************************************************************/

/*  The capability queries return 1 or 0, or -1 with errno EUNKNOWNTYPE.     */
RSFRAME_EXPORT int rsframe_type_has_initial_request_n (int type_);
RSFRAME_EXPORT int rsframe_type_can_have_data (int type_);
RSFRAME_EXPORT int rsframe_type_can_have_metadata (int type_);
RSFRAME_EXPORT int rsframe_type_is_fragmentable (int type_);

/*  Returns the type name or NULL with errno EUNKNOWNTYPE.                    */
RSFRAME_EXPORT const char *rsframe_type_name (int type_);

/******************************************************************************/
/*  Stream identifiers.                                                       */
/******************************************************************************/
RSFRAME_EXPORT int rsframe_stream_is_connection_level (uint32_t stream_id_);
RSFRAME_EXPORT int rsframe_stream_is_client_initiated (uint32_t stream_id_);
RSFRAME_EXPORT int rsframe_stream_is_server_initiated (uint32_t stream_id_);

/******************************************************************************/
/*  Decoded frames.                                                           */
/******************************************************************************/

/*  A decoded frame is a view into the buffer it was decoded from. The view   */
/*  is invalidated once that buffer is released or mutated.                   */
typedef struct rsframe_frame_t
{
#if defined(_MSC_VER) && (defined(_M_X64) || defined(_M_ARM64))
    __declspec(align (8)) unsigned char _[64];
#else
    unsigned char _[64] __attribute__ ((aligned (sizeof (void *))));
#endif
} rsframe_frame_t;

/**
 * @brief Decode one frame (without length prefix) from buf_.
 * @return 0 on success, -1 on failure (errno: EMALFORMED, EPAYLOADSIZE).
 */
RSFRAME_EXPORT int
rsframe_frame_decode (rsframe_frame_t *frame_, const void *buf_, size_t size_);

/*  After a failed decode the frame is empty: rsframe_frame_type and the      */
/*  accessors with out-parameters return -1 with errno EFSM, the flag and     */
/*  size queries return 0.                                                    */
RSFRAME_EXPORT uint32_t rsframe_frame_stream_id (const rsframe_frame_t *frame_);
RSFRAME_EXPORT int rsframe_frame_type (const rsframe_frame_t *frame_);
RSFRAME_EXPORT int rsframe_frame_flags (const rsframe_frame_t *frame_);
RSFRAME_EXPORT int rsframe_frame_has_metadata (const rsframe_frame_t *frame_);
RSFRAME_EXPORT int rsframe_frame_has_follows (const rsframe_frame_t *frame_);
RSFRAME_EXPORT int rsframe_frame_is_complete (const rsframe_frame_t *frame_);
RSFRAME_EXPORT int rsframe_frame_is_next (const rsframe_frame_t *frame_);
RSFRAME_EXPORT size_t rsframe_frame_size (const rsframe_frame_t *frame_);

/*  The whole encoded frame, header included. This is the only view of the    */
/*  body of SETUP, RESUME, RESUME_OK and EXT frames.                          */
RSFRAME_EXPORT int rsframe_frame_buffer (const rsframe_frame_t *frame_,
                                         const void **data_,
                                         size_t *size_);

/*  Fails with ENOMETADATA when the METADATA flag is unset.                   */
RSFRAME_EXPORT int rsframe_frame_metadata (const rsframe_frame_t *frame_,
                                           const void **data_,
                                           size_t *size_);

/*  Fails with EDATANOTSUP when the frame type cannot carry data.             */
RSFRAME_EXPORT int rsframe_frame_data (const rsframe_frame_t *frame_,
                                       const void **data_,
                                       size_t *size_);

/*  Fails with EREQNNOTSUP when the frame type carries no request-N.          */
RSFRAME_EXPORT int rsframe_frame_request_n (const rsframe_frame_t *frame_,
                                            uint32_t *request_n_);

RSFRAME_EXPORT int rsframe_frame_error_code (const rsframe_frame_t *frame_,
                                             uint32_t *error_code_);

RSFRAME_EXPORT int rsframe_frame_last_position (const rsframe_frame_t *frame_,
                                                uint64_t *position_);

/*  TTL in milliseconds and request count of a LEASE frame.                   */
RSFRAME_EXPORT int rsframe_frame_lease (const rsframe_frame_t *frame_,
                                        uint32_t *ttl_,
                                        uint32_t *requests_);

/**
 * @brief Compute the data block length of an encoded frame without
 *        decoding it.
 * @return Data length, or -1 on failure (errno: EMALFORMED, EPAYLOADSIZE).
 */
RSFRAME_EXPORT long rsframe_frame_data_length (const void *buf_, size_t size_);

/******************************************************************************/
/*  Encoding.                                                                 */
/******************************************************************************/

/*  Field set describing one frame to encode. Fields that the frame type      */
/*  does not carry are ignored, except metadata and data, which are errors.   */
typedef struct rsframe_fields_t
{
    uint32_t stream_id;
    int type;
    int flags;
    int has_metadata;
    const void *metadata;
    size_t metadata_size;
    const void *data;
    size_t data_size;
    uint32_t request_n;
    uint32_t error_code;
    uint64_t position;
    uint32_t ttl;
    uint32_t lease_requests;
} rsframe_fields_t;

RSFRAME_EXPORT void rsframe_fields_init (rsframe_fields_t *fields_,
                                         int type_,
                                         uint32_t stream_id_);

/**
 * @brief Encode a frame into buf_. If length_prefix_ is non-zero the 3-byte
 *        frame length is written first.
 * @return Bytes written, or -1 on failure (errno: EINVAL, EUNKNOWNTYPE,
 *         ENOTSUP, EDATANOTSUP, EMSGSIZE, ENOBUFS).
 */
RSFRAME_EXPORT int rsframe_frame_encode (const rsframe_fields_t *fields_,
                                         void *buf_,
                                         size_t size_,
                                         int length_prefix_);

/*  Size of the encoded frame (length prefix excluded) or -1.                 */
RSFRAME_EXPORT long rsframe_frame_encoded_size (const rsframe_fields_t *fields_);

/******************************************************************************/
/*  Fragmentation.                                                            */
/******************************************************************************/

/**
 * @brief Create a splitter for one logical frame. The metadata and data
 *        referenced by fields_ must outlive the splitter.
 * @return Handle, or NULL on failure (errno: EINVAL, EMSGSIZE, ...).
 */
RSFRAME_EXPORT void *rsframe_fragmenter_new (const rsframe_fields_t *fields_,
                                             size_t max_frame_size_);

/**
 * @brief Write the next fragment frame into buf_.
 * @return Bytes written, 0 when all fragments were produced, -1 on failure.
 */
RSFRAME_EXPORT int
rsframe_fragmenter_next (void *fragmenter_, void *buf_, size_t size_);

RSFRAME_EXPORT int rsframe_fragmenter_close (void *fragmenter_);

/*  Logical message as assembled from one or more frames.                     */
typedef struct rsframe_message_t
{
    uint32_t stream_id;
    int type;
    int flags;
    int has_metadata;
    const void *metadata;
    size_t metadata_size;
    int has_data;
    const void *data;
    size_t data_size;
    int has_request_n;
    uint32_t request_n;
    int fragments;
} rsframe_message_t;

RSFRAME_EXPORT void *rsframe_assembler_new (void);
RSFRAME_EXPORT int rsframe_assembler_close (void *assembler_);
RSFRAME_EXPORT int rsframe_assembler_setopt (void *assembler_,
                                             int option_,
                                             const void *optval_,
                                             size_t optvallen_);
RSFRAME_EXPORT int rsframe_assembler_getopt (void *assembler_,
                                             int option_,
                                             void *optval_,
                                             size_t *optvallen_);

/**
 * @brief Feed one decoded frame, in wire order.
 * @return 1 if a message is complete and was stored in message_ (valid until
 *         the next call on this assembler), 0 if the frame was buffered,
 *         -1 on failure (errno: EMALFORMED, EINTERLEAVED, EMSGSIZE).
 */
RSFRAME_EXPORT int rsframe_assembler_push (void *assembler_,
                                           const rsframe_frame_t *frame_,
                                           rsframe_message_t *message_);

/*  Discard the open chain of a stream, if any.                               */
RSFRAME_EXPORT int rsframe_assembler_cancel (void *assembler_,
                                             uint32_t stream_id_);

/*  Connection end. Fails with EINCOMPLETE if a chain was still open.         */
RSFRAME_EXPORT int rsframe_assembler_finish (void *assembler_);

/******************************************************************************/
/*  Length-prefixed stream decoding.                                          */
/******************************************************************************/
RSFRAME_EXPORT void *rsframe_stream_decoder_new (void);
RSFRAME_EXPORT int rsframe_stream_decoder_close (void *decoder_);
RSFRAME_EXPORT int rsframe_stream_decoder_setopt (void *decoder_,
                                                  int option_,
                                                  const void *optval_,
                                                  size_t optvallen_);

/**
 * @brief Consume bytes from buf_. *consumed_ receives the number of bytes
 *        used; the caller feeds the rest again after handling a frame.
 * @return 1 when a frame was stored in frame_, 0 when more input is needed,
 *         -1 on failure (errno: EMSGSIZE, EMALFORMED, EPAYLOADSIZE, EFSM).
 */
RSFRAME_EXPORT int rsframe_stream_decoder_decode (void *decoder_,
                                                  const void *buf_,
                                                  size_t size_,
                                                  size_t *consumed_,
                                                  rsframe_frame_t *frame_);

RSFRAME_EXPORT int rsframe_stream_decoder_reset (void *decoder_);

#ifdef __cplusplus
}
#endif

#endif
