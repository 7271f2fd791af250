/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"

#include <string.h>
#include <new>

#include "protocol/fragmenter.hpp"
#include "protocol/frame.hpp"
#include "protocol/frame_encoder.hpp"
#include "protocol/frame_header.hpp"
#include "protocol/frame_type.hpp"
#include "protocol/reassembler.hpp"
#include "protocol/stream_decoder.hpp"
#include "protocol/stream_id.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

//  Compile time check whether frame_t fits into rsframe_frame_t.
typedef char check_frame_t_size
  [sizeof (rsframe::frame_t) <= sizeof (rsframe_frame_t) ? 1 : -1];

void rsframe_version (int *major_, int *minor_, int *patch_)
{
    *major_ = RSFRAME_VERSION_MAJOR;
    *minor_ = RSFRAME_VERSION_MINOR;
    *patch_ = RSFRAME_VERSION_PATCH;
}

const char *rsframe_strerror (int errnum_)
{
    return rsframe::errno_to_string (errnum_);
}

int rsframe_errno (void)
{
    return errno;
}

//  Header and taxonomy

int rsframe_header_encode (
  void *buf_, size_t size_, uint32_t stream_id_, int type_, int flags_)
{
    if (!buf_) {
        errno = EFAULT;
        return -1;
    }
    return rsframe::encode_header (static_cast<unsigned char *> (buf_), size_,
                                   stream_id_, type_, flags_);
}

int rsframe_header_decode (const void *buf_,
                           size_t size_,
                           uint32_t *stream_id_,
                           int *type_,
                           int *flags_)
{
    if (!buf_ && size_ > 0) {
        errno = EFAULT;
        return -1;
    }
    rsframe::frame_header_t header;
    if (rsframe::decode_header (static_cast<const unsigned char *> (buf_),
                                size_, &header)
        == -1)
        return -1;
    if (stream_id_)
        *stream_id_ = header.stream_id;
    if (type_)
        *type_ = header.type ();
    if (flags_)
        *flags_ = header.flags;
    return 0;
}

int rsframe_type_has_initial_request_n (int type_)
{
    return rsframe::has_initial_request_n (type_);
}

int rsframe_type_can_have_data (int type_)
{
    return rsframe::can_have_data (type_);
}

int rsframe_type_can_have_metadata (int type_)
{
    return rsframe::can_have_metadata (type_);
}

int rsframe_type_is_fragmentable (int type_)
{
    return rsframe::is_fragmentable (type_);
}

const char *rsframe_type_name (int type_)
{
    const rsframe::frame_type_info_t *info = rsframe::find_frame_type (type_);
    return info ? info->name : NULL;
}

//  Stream identifiers

int rsframe_stream_is_connection_level (uint32_t stream_id_)
{
    return rsframe::is_connection_level (stream_id_) ? 1 : 0;
}

int rsframe_stream_is_client_initiated (uint32_t stream_id_)
{
    return rsframe::is_client_initiated (stream_id_) ? 1 : 0;
}

int rsframe_stream_is_server_initiated (uint32_t stream_id_)
{
    return rsframe::is_server_initiated (stream_id_) ? 1 : 0;
}

//  Decoded frames

static const rsframe::frame_t *as_frame (const rsframe_frame_t *frame_)
{
    return reinterpret_cast<const rsframe::frame_t *> (frame_);
}

int rsframe_frame_decode (rsframe_frame_t *frame_,
                          const void *buf_,
                          size_t size_)
{
    if (!frame_ || (!buf_ && size_ > 0)) {
        errno = EFAULT;
        return -1;
    }
    rsframe::frame_t *frame = new (frame_) rsframe::frame_t;
    return frame->init (static_cast<const unsigned char *> (buf_), size_);
}

uint32_t rsframe_frame_stream_id (const rsframe_frame_t *frame_)
{
    return as_frame (frame_)->stream_id ();
}

int rsframe_frame_type (const rsframe_frame_t *frame_)
{
    const rsframe::frame_t *frame = as_frame (frame_);
    if (!frame->valid ()) {
        errno = EFSM;
        return -1;
    }
    return frame->type ();
}

int rsframe_frame_flags (const rsframe_frame_t *frame_)
{
    return as_frame (frame_)->flags ();
}

int rsframe_frame_has_metadata (const rsframe_frame_t *frame_)
{
    return as_frame (frame_)->has_metadata () ? 1 : 0;
}

int rsframe_frame_has_follows (const rsframe_frame_t *frame_)
{
    return as_frame (frame_)->has_follows () ? 1 : 0;
}

int rsframe_frame_is_complete (const rsframe_frame_t *frame_)
{
    return as_frame (frame_)->is_complete () ? 1 : 0;
}

int rsframe_frame_is_next (const rsframe_frame_t *frame_)
{
    return as_frame (frame_)->is_next () ? 1 : 0;
}

size_t rsframe_frame_size (const rsframe_frame_t *frame_)
{
    return as_frame (frame_)->buffer ().size ();
}

int rsframe_frame_buffer (const rsframe_frame_t *frame_,
                          const void **data_,
                          size_t *size_)
{
    const rsframe::frame_t *frame = as_frame (frame_);
    if (!frame->valid ()) {
        errno = EFSM;
        return -1;
    }
    const boost::asio::const_buffer buffer = frame->buffer ();
    *data_ = buffer.data ();
    *size_ = buffer.size ();
    return 0;
}

int rsframe_frame_metadata (const rsframe_frame_t *frame_,
                            const void **data_,
                            size_t *size_)
{
    boost::asio::const_buffer metadata;
    if (as_frame (frame_)->metadata (&metadata) == -1)
        return -1;
    *data_ = metadata.data ();
    *size_ = metadata.size ();
    return 0;
}

int rsframe_frame_data (const rsframe_frame_t *frame_,
                        const void **data_,
                        size_t *size_)
{
    boost::asio::const_buffer data;
    if (as_frame (frame_)->data (&data) == -1)
        return -1;
    *data_ = data.data ();
    *size_ = data.size ();
    return 0;
}

int rsframe_frame_request_n (const rsframe_frame_t *frame_,
                             uint32_t *request_n_)
{
    return as_frame (frame_)->request_n (request_n_);
}

int rsframe_frame_error_code (const rsframe_frame_t *frame_,
                              uint32_t *error_code_)
{
    return as_frame (frame_)->error_code (error_code_);
}

int rsframe_frame_last_position (const rsframe_frame_t *frame_,
                                 uint64_t *position_)
{
    return as_frame (frame_)->last_position (position_);
}

int rsframe_frame_lease (const rsframe_frame_t *frame_,
                         uint32_t *ttl_,
                         uint32_t *requests_)
{
    return as_frame (frame_)->lease (ttl_, requests_);
}

long rsframe_frame_data_length (const void *buf_, size_t size_)
{
    if (!buf_ && size_ > 0) {
        errno = EFAULT;
        return -1;
    }
    size_t length = 0;
    if (rsframe::frame_t::data_length (static_cast<const unsigned char *> (buf_),
                                       size_, &length)
        == -1)
        return -1;
    return static_cast<long> (length);
}

//  Encoding

void rsframe_fields_init (rsframe_fields_t *fields_,
                          int type_,
                          uint32_t stream_id_)
{
    rsframe::init_fields (fields_, type_, stream_id_);
}

int rsframe_frame_encode (const rsframe_fields_t *fields_,
                          void *buf_,
                          size_t size_,
                          int length_prefix_)
{
    if (!fields_ || (!buf_ && size_ > 0)) {
        errno = EFAULT;
        return -1;
    }
    rsframe::frame_encoder_t encoder;
    if (encoder.load (*fields_) == -1)
        return -1;
    return encoder.encode (static_cast<unsigned char *> (buf_), size_,
                           length_prefix_ != 0);
}

long rsframe_frame_encoded_size (const rsframe_fields_t *fields_)
{
    if (!fields_) {
        errno = EFAULT;
        return -1;
    }
    rsframe::frame_encoder_t encoder;
    if (encoder.load (*fields_) == -1)
        return -1;
    return static_cast<long> (encoder.size ());
}

//  Fragmentation

void *rsframe_fragmenter_new (const rsframe_fields_t *fields_,
                              size_t max_frame_size_)
{
    if (!fields_) {
        errno = EFAULT;
        return NULL;
    }
    rsframe::fragmenter_t *fragmenter = new (std::nothrow) rsframe::fragmenter_t;
    if (!fragmenter) {
        errno = ENOMEM;
        return NULL;
    }
    if (fragmenter->init (*fields_, max_frame_size_) == -1) {
        const int en = errno;
        delete fragmenter;
        errno = en;
        return NULL;
    }
    return fragmenter;
}

int rsframe_fragmenter_next (void *fragmenter_, void *buf_, size_t size_)
{
    rsframe::fragmenter_t *fragmenter =
      static_cast<rsframe::fragmenter_t *> (fragmenter_);
    if (!fragmenter || !fragmenter->check_tag ()) {
        errno = EFAULT;
        return -1;
    }
    return fragmenter->next (static_cast<unsigned char *> (buf_), size_,
                             false);
}

int rsframe_fragmenter_close (void *fragmenter_)
{
    rsframe::fragmenter_t *fragmenter =
      static_cast<rsframe::fragmenter_t *> (fragmenter_);
    if (!fragmenter || !fragmenter->check_tag ()) {
        errno = EFAULT;
        return -1;
    }
    delete fragmenter;
    return 0;
}

//  Reassembly

static rsframe::reassembler_t *as_assembler (void *assembler_)
{
    rsframe::reassembler_t *assembler =
      static_cast<rsframe::reassembler_t *> (assembler_);
    if (!assembler || !assembler->check_tag ()) {
        errno = EFAULT;
        return NULL;
    }
    return assembler;
}

void *rsframe_assembler_new (void)
{
    rsframe::reassembler_t *assembler =
      new (std::nothrow) rsframe::reassembler_t;
    if (!assembler)
        errno = ENOMEM;
    return assembler;
}

int rsframe_assembler_close (void *assembler_)
{
    rsframe::reassembler_t *assembler = as_assembler (assembler_);
    if (!assembler)
        return -1;
    delete assembler;
    return 0;
}

int rsframe_assembler_setopt (void *assembler_,
                              int option_,
                              const void *optval_,
                              size_t optvallen_)
{
    rsframe::reassembler_t *assembler = as_assembler (assembler_);
    if (!assembler)
        return -1;
    return assembler->setopt (option_, optval_, optvallen_);
}

int rsframe_assembler_getopt (void *assembler_,
                              int option_,
                              void *optval_,
                              size_t *optvallen_)
{
    rsframe::reassembler_t *assembler = as_assembler (assembler_);
    if (!assembler)
        return -1;
    return assembler->getopt (option_, optval_, optvallen_);
}

int rsframe_assembler_push (void *assembler_,
                            const rsframe_frame_t *frame_,
                            rsframe_message_t *message_)
{
    rsframe::reassembler_t *assembler = as_assembler (assembler_);
    if (!assembler)
        return -1;
    if (!frame_ || !message_) {
        errno = EFAULT;
        return -1;
    }
    const rsframe::frame_t *frame = as_frame (frame_);
    if (!frame->valid ()) {
        errno = EINVAL;
        return -1;
    }

    rsframe::message_t msg;
    const int rc = assembler->push (*frame, &msg);
    if (rc != 1)
        return rc;

    message_->stream_id = msg.stream_id;
    message_->type = msg.info->type;
    message_->flags = msg.flags;
    message_->has_metadata = msg.has_metadata ? 1 : 0;
    message_->metadata = msg.metadata.data ();
    message_->metadata_size = msg.metadata.size ();
    message_->has_data = msg.has_data ? 1 : 0;
    message_->data = msg.data.data ();
    message_->data_size = msg.data.size ();
    message_->has_request_n = msg.has_request_n ? 1 : 0;
    message_->request_n = msg.request_n;
    message_->fragments = msg.fragments;
    return 1;
}

int rsframe_assembler_cancel (void *assembler_, uint32_t stream_id_)
{
    rsframe::reassembler_t *assembler = as_assembler (assembler_);
    if (!assembler)
        return -1;
    assembler->cancel (stream_id_);
    return 0;
}

int rsframe_assembler_finish (void *assembler_)
{
    rsframe::reassembler_t *assembler = as_assembler (assembler_);
    if (!assembler)
        return -1;
    return assembler->finish ();
}

//  Length-prefixed stream decoding

static rsframe::stream_decoder_t *as_stream_decoder (void *decoder_)
{
    rsframe::stream_decoder_t *decoder =
      static_cast<rsframe::stream_decoder_t *> (decoder_);
    if (!decoder || !decoder->check_tag ()) {
        errno = EFAULT;
        return NULL;
    }
    return decoder;
}

void *rsframe_stream_decoder_new (void)
{
    rsframe::stream_decoder_t *decoder =
      new (std::nothrow) rsframe::stream_decoder_t;
    if (!decoder)
        errno = ENOMEM;
    return decoder;
}

int rsframe_stream_decoder_close (void *decoder_)
{
    rsframe::stream_decoder_t *decoder = as_stream_decoder (decoder_);
    if (!decoder)
        return -1;
    delete decoder;
    return 0;
}

int rsframe_stream_decoder_setopt (void *decoder_,
                                   int option_,
                                   const void *optval_,
                                   size_t optvallen_)
{
    rsframe::stream_decoder_t *decoder = as_stream_decoder (decoder_);
    if (!decoder)
        return -1;
    return decoder->setopt (option_, optval_, optvallen_);
}

int rsframe_stream_decoder_decode (void *decoder_,
                                   const void *buf_,
                                   size_t size_,
                                   size_t *consumed_,
                                   rsframe_frame_t *frame_)
{
    rsframe::stream_decoder_t *decoder = as_stream_decoder (decoder_);
    if (!decoder)
        return -1;
    if (!consumed_ || !frame_ || (!buf_ && size_ > 0)) {
        errno = EFAULT;
        return -1;
    }
    const int rc = decoder->decode (static_cast<const unsigned char *> (buf_),
                                    size_, consumed_);
    if (rc == 1)
        new (frame_) rsframe::frame_t (decoder->frame ());
    return rc;
}

int rsframe_stream_decoder_reset (void *decoder_)
{
    rsframe::stream_decoder_t *decoder = as_stream_decoder (decoder_);
    if (!decoder)
        return -1;
    decoder->reset ();
    return 0;
}
