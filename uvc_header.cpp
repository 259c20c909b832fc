#include "uvc_header.h"

unsigned parse_uvc_header(const uint8_t *data, size_t len, UVCHeader *header)
{
	if (len < UVC_MIN_HEADER_LENGTH) {
		return 0;
	}

	unsigned header_len = data[0];
	uint8_t flags = data[1];
	if ((flags & UVC_STREAM_EOH) == 0) {
		return 0;
	}
	if (header_len < UVC_MIN_HEADER_LENGTH ||
	    header_len > UVC_MAX_HEADER_LENGTH ||
	    header_len > len) {
		return 0;
	}

	if (header != nullptr) {
		header->length = header_len;
		header->flags = flags;
	}
	return header_len;
}

unsigned uvc_header_length_from_flags(uint8_t flags)
{
	unsigned len = UVC_MIN_HEADER_LENGTH;
	if (flags & UVC_STREAM_PTS) {
		len += 4;
	}
	if (flags & UVC_STREAM_SCR) {
		len += 6;
	}
	return len;
}

bool starts_with_jpeg_soi(const uint8_t *data, size_t len)
{
	return len >= 2 && data[0] == 0xff && data[1] == 0xd8;
}

bool ends_with_jpeg_eoi(const uint8_t *data, size_t len)
{
	return len >= 2 && data[len - 2] == 0xff && data[len - 1] == 0xd9;
}
