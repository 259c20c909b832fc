#ifndef _UVC_HEADER_H
#define _UVC_HEADER_H 1

// The UVC payload header that (nominally) starts every isochronous packet:
//
//   byte 0      header length, including this byte (2..12)
//   byte 1      bmHeaderInfo flags, see below
//   bytes 2-5   PTS, if UVC_STREAM_PTS is set
//   bytes 6-11  SCR, if UVC_STREAM_SCR is set
//
// Many cheap cameras get the details wrong (reserved bits set, length not
// matching the PTS/SCR flags), so the only things we insist on are the
// end-of-header bit and a sane length.

#include <stddef.h>
#include <stdint.h>

#define UVC_STREAM_EOH (1 << 7)
#define UVC_STREAM_ERR (1 << 6)
#define UVC_STREAM_STI (1 << 5)
#define UVC_STREAM_RES (1 << 4)
#define UVC_STREAM_SCR (1 << 3)
#define UVC_STREAM_PTS (1 << 2)
#define UVC_STREAM_EOF (1 << 1)
#define UVC_STREAM_FID (1 << 0)

#define UVC_MIN_HEADER_LENGTH 2
#define UVC_MAX_HEADER_LENGTH 12

struct UVCHeader {
	unsigned length = 0;
	uint8_t flags = 0;

	bool frame_id() const { return flags & UVC_STREAM_FID; }
	bool end_of_frame() const { return flags & UVC_STREAM_EOF; }
	bool error() const { return flags & UVC_STREAM_ERR; }
	bool has_pts() const { return flags & UVC_STREAM_PTS; }
	bool has_scr() const { return flags & UVC_STREAM_SCR; }
};

// Returns the header length if <data> starts with something we accept as a
// UVC payload header, and fills in <header> (which can be nullptr).
// Returns 0 if not, in which case the entire packet should be taken as payload.
unsigned parse_uvc_header(const uint8_t *data, size_t len, UVCHeader *header);

// Header length implied by the PTS/SCR flags. Only used for diagnostics;
// the declared length always wins.
unsigned uvc_header_length_from_flags(uint8_t flags);

// JPEG start-of-image (FF D8) and end-of-image (FF D9) markers.
bool starts_with_jpeg_soi(const uint8_t *data, size_t len);
bool ends_with_jpeg_eoi(const uint8_t *data, size_t len);

#endif  // !defined(_UVC_HEADER_H)
