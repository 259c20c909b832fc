#include "frame_assembler.h"

#include <stdio.h>
#include <string.h>
#include <algorithm>

#include "defs.h"
#include "uvc_header.h"

using namespace std;

namespace {

bool should_log(uint64_t count)
{
	return count <= LOG_FIRST_N || count % LOG_EVERY_N == 0;
}

FrameFormat raw_frame_format(StreamFormat format)
{
	return format == STREAM_FORMAT_UYVY ? FRAME_FORMAT_UYVY : FRAME_FORMAT_YUY2;
}

}  // namespace

FrameAssembler::FrameAssembler(const StreamParams &params, FrameAllocator *allocator)
	: params(params),
	  allocator(allocator),
	  expected_frame_size_(expected_raw_frame_size(params))
{
	switch (params.format) {
	case STREAM_FORMAT_MJPEG:
		format_known_ = true;
		format_ = FRAME_FORMAT_MJPEG;
		break;
	case STREAM_FORMAT_YUY2:
	case STREAM_FORMAT_UYVY:
		format_known_ = true;
		format_ = raw_frame_format(params.format);
		synced_ = true;
		break;
	case STREAM_FORMAT_AUTO:
		break;
	}
	current_frame = allocator->alloc_frame();
}

FrameAssembler::~FrameAssembler()
{
	if (current_frame.data != nullptr) {
		allocator->release_frame(current_frame);
	}
}

void FrameAssembler::reset(bool forget_format)
{
	current_frame.len = 0;
	current_frame.overflow = 0;
	if (current_frame.data == nullptr) {
		current_frame = allocator->alloc_frame();
	}
	last_frame_id_ = -1;
	fid_check_pending = false;

	if (forget_format && params.format == STREAM_FORMAT_AUTO) {
		format_known_ = false;
		num_first_bytes = 0;
	}
	synced_ = is_raw();
}

void FrameAssembler::consume(const UrbPayload &payload, vector<AssembledFrame> *out)
{
	for (const PacketMeta &packet_meta : payload.packets) {
		if (packet_meta.error) {
			handle_packet_error();
			continue;
		}

		// Decided per packet, in sequence order, so that the bytes of a
		// frame never depend on the order transfers completed in.
		PacketMeta meta = packet_meta;
		const uint8_t *start = payload.data.data() + meta.offset;
		if (keeps_headers()) {
			meta.length += meta.header_length;
			meta.header_length = 0;
			meta.has_header = meta.frame_id = meta.end_of_frame = meta.header_error = false;
		} else {
			start += meta.header_length;
			if (meta.header_error) {
				++stats_.uvc_errors;
				if (should_log(stats_.uvc_errors)) {
					fprintf(stderr, "UVC error bit set in payload header (%llu so far)\n",
						(unsigned long long)stats_.uvc_errors);
				}
				handle_packet_error();
				continue;
			}
		}
		if (is_zero_filled(start, meta.length)) {
			++stats_.zero_filled_payloads;
			meta.length = 0;
		}

		if (!format_known_) {
			if (meta.length == 0) {
				continue;
			}
			detect_format(start, meta.length);
			if (!format_known_) {
				// Only one byte so far; keep it, since it belongs to the frame
				// whatever the format turns out to be.
				add_to_frame(start, meta.length);
				continue;
			}
		}
		if (format_ == FRAME_FORMAT_MJPEG) {
			consume_mjpeg_packet(meta, start, out);
		} else {
			consume_raw_packet(meta, start, out);
		}
	}
}

void FrameAssembler::detect_format(const uint8_t *start, size_t len)
{
	for (size_t i = 0; i < len && num_first_bytes < 2; ++i) {
		first_bytes[num_first_bytes++] = start[i];
	}
	if (num_first_bytes < 2) {
		return;
	}

	format_known_ = true;
	if (starts_with_jpeg_soi(first_bytes, 2)) {
		format_ = FRAME_FORMAT_MJPEG;
		// The stream starts at a start of image, so we are already in sync.
		synced_ = true;
		printf("Detected MJPEG format from JPEG SOI marker\n");
	} else {
		format_ = FRAME_FORMAT_YUY2;
		synced_ = true;
		printf("Detected uncompressed (YUY2) format, using size-based frame detection (%zu bytes per frame)\n",
			expected_frame_size_);
	}
}

void FrameAssembler::handle_packet_error()
{
	if (!is_mjpeg()) {
		// Raw: the packet contributes nothing. (If it carried data, the frame
		// will be short and validation will say so.)
		return;
	}
	if (current_frame.len > 0 || synced_) {
		++stats_.error_resyncs;
		if (should_log(stats_.error_resyncs)) {
			fprintf(stderr, "Packet error in MJPEG stream, dropping %zu buffered bytes and waiting for next frame\n",
				current_frame.len);
		}
	}
	current_frame.len = 0;
	current_frame.overflow = 0;
	synced_ = false;
}

void FrameAssembler::track_frame_id(const PacketMeta &meta)
{
	if (!meta.has_header) {
		return;
	}
	int fid = meta.frame_id ? 1 : 0;
	if (fid_check_pending) {
		if (last_frame_id_ == fid) {
			++stats_.fid_unconfirmed;
		}
		fid_check_pending = false;
	}
	if (last_frame_id_ != -1 && last_frame_id_ != fid) {
		++stats_.fid_toggles;
	}
	last_frame_id_ = fid;
}

void FrameAssembler::consume_mjpeg_packet(const PacketMeta &meta, const uint8_t *start, vector<AssembledFrame> *out)
{
	track_frame_id(meta);

	if (!synced_) {
		if (current_frame.len == 0 && starts_with_jpeg_soi(start, meta.length)) {
			synced_ = true;
		} else {
			stats_.unsynced_bytes += meta.length;
			return;
		}
	}

	add_to_frame(start, meta.length);
	if (meta.end_of_frame) {
		finish_mjpeg_frame(out);
	}
}

void FrameAssembler::finish_mjpeg_frame(vector<AssembledFrame> *out)
{
	fid_check_pending = true;

	if (current_frame.data == nullptr || current_frame.overflow > 0) {
		if (current_frame.overflow > 0) {
			fprintf(stderr, "MJPEG frame overflowed the %zu-byte buffer by %zu bytes, dropping\n",
				current_frame.size, current_frame.overflow);
		}
		drop_frame();
		return;
	}

	uint8_t *data = current_frame.data;
	size_t len = current_frame.len;
	if (ends_with_jpeg_eoi(data, len)) {
		if (starts_with_jpeg_soi(data, len)) {
			emit_frame("EOF", out);
			return;
		}

		// Some devices put a few bytes of junk in front of the image.
		size_t limit = min<size_t>(MJPEG_SOI_SEARCH_LIMIT, len - 2);
		for (size_t i = 1; i <= limit; ++i) {
			if (data[i] == 0xff && data[i + 1] == 0xd8) {
				printf("Found JPEG SOI at offset %zu, discarding bytes in front of it\n", i);
				memmove(data, data + i, len - i);
				current_frame.len = len - i;
				emit_frame("EOF, SOI found at offset", out);
				return;
			}
		}
	}

	++stats_.incomplete_frames;
	if (should_log(stats_.incomplete_frames)) {
		fprintf(stderr, "Incomplete MJPEG frame (%zu bytes, start %02x %02x), dropping\n",
			len, len >= 1 ? data[0] : 0, len >= 2 ? data[1] : 0);
	}
	current_frame.len = 0;
	current_frame.overflow = 0;
	synced_ = false;
}

void FrameAssembler::consume_raw_packet(const PacketMeta &meta, const uint8_t *start, vector<AssembledFrame> *out)
{
	if (expected_frame_size_ == 0) {
		return;
	}

	size_t len = meta.length;
	while (len > 0) {
		size_t bytes = min(len, expected_frame_size_ - min(current_frame.len, expected_frame_size_));
		add_to_frame(start, bytes);
		start += bytes;
		len -= bytes;
		if (current_frame.len >= expected_frame_size_) {
			complete_raw_frame(out);
		}
	}
}

void FrameAssembler::complete_raw_frame(vector<AssembledFrame> *out)
{
	if (current_frame.data == nullptr || current_frame.overflow > 0) {
		drop_frame();
		return;
	}
	emit_frame("size", out);
}

void FrameAssembler::add_to_frame(const uint8_t *start, size_t len)
{
	if (current_frame.data == nullptr) {
		// Dropping this frame, but keep counting so that a raw stream
		// stays aligned with the frame boundaries.
		current_frame.len += len;
		return;
	}
	if (current_frame.len + len > current_frame.size) {
		size_t room = current_frame.size > current_frame.len ? current_frame.size - current_frame.len : 0;
		memcpy(current_frame.data + current_frame.len, start, room);
		current_frame.len += room;
		current_frame.overflow += len - room;
		return;
	}
	memcpy(current_frame.data + current_frame.len, start, len);
	current_frame.len += len;
}

void FrameAssembler::emit_frame(const char *trigger, vector<AssembledFrame> *out)
{
	++stats_.frames_completed;
	if (stats_.frames_completed <= LOG_BOUNDARY_FRAMES) {
		printf("Complete %s frame #%llu: %zu bytes (trigger: %s)\n",
			frame_format_name(format_), (unsigned long long)stats_.frames_completed,
			current_frame.len, trigger);
	}

	AssembledFrame assembled;
	assembled.frame = current_frame;
	assembled.format = format_;
	out->push_back(assembled);

	current_frame = FrameAllocator::Frame();
	start_new_frame();
}

void FrameAssembler::drop_frame()
{
	++stats_.frames_dropped;
	if (current_frame.data == nullptr) {
		start_new_frame();
	} else {
		current_frame.len = 0;
		current_frame.overflow = 0;
	}
}

void FrameAssembler::start_new_frame()
{
	if (current_frame.data != nullptr) {
		allocator->release_frame(current_frame);
	}
	current_frame = allocator->alloc_frame();
	current_frame.len = 0;
	current_frame.overflow = 0;
}
