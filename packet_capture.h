#ifndef _PACKET_CAPTURE_H
#define _PACKET_CAPTURE_H 1

// Recording of raw isochronous packets (UVC headers included) to a file,
// so that a misbehaving camera can be studied, and the assembly pipeline
// tested, without the camera. Each record is, little-endian:
//
//   u64  microseconds since the start of the capture
//   u32  packet length
//   u8   endpoint address
//   ...  <length> bytes of packet data
//
// Beside the capture, <filename>.meta holds what is known about the device
// and the stream, one "key value" pair per line, so that a replay can be
// set up the same way as the live stream was.

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "stream_params.h"
#include "video_frame.h"

#define CAPTURE_RECORD_HEADER_SIZE 13

struct CapturedPacket {
	uint64_t timestamp_us = 0;
	uint8_t endpoint = 0;
	std::vector<uint8_t> data;
};

struct CaptureMetadata {
	int vendor_id = -1, product_id = -1;  // -1 = unknown.
	uint8_t endpoint = 0x81;
	StreamFormat format = STREAM_FORMAT_AUTO;
	unsigned width = 0, height = 0;  // 0 = unknown.
	std::string description;

	// Filled in by PacketRecorder::close().
	uint64_t total_packets = 0, total_bytes = 0, total_frames = 0;
	uint64_t duration_ms = 0;
};

std::string capture_metadata_filename(const std::string &capture_filename);
bool write_capture_metadata(const std::string &filename, const CaptureMetadata &metadata);

// Unknown keys are skipped with a warning; a line with no value, or a bad
// number or format, makes the whole file rejected.
bool read_capture_metadata(const std::string &filename, CaptureMetadata *metadata);

// Copies the stream geometry, format and endpoint into <params>, where known.
void apply_capture_metadata(const CaptureMetadata &metadata, StreamParams *params);

class PacketRecorder {
public:
	PacketRecorder() {}
	~PacketRecorder();

	bool open(const std::string &filename);

	// Also writes the metadata sidecar.
	void close();
	bool is_open() const;

	// Thread-safe. Write errors are logged once and stop further recording.
	void record(const uint8_t *data, size_t len, uint8_t endpoint);
	void record_at(uint64_t timestamp_us, const uint8_t *data, size_t len, uint8_t endpoint);

	// Device and stream description for the sidecar. The totals are
	// overwritten on close.
	void set_metadata(const CaptureMetadata &metadata);

	// Called for every frame the stream delivers. Also fills in the format
	// if it was left to autodetection.
	void count_frame(FrameFormat format);

	uint64_t num_packets() const;
	uint64_t num_bytes() const;
	uint64_t num_frames() const;

private:
	mutable std::mutex mu;
	FILE *fp = nullptr;  // Under <mu>.
	std::string filename;
	std::chrono::steady_clock::time_point start;
	uint64_t packets_written = 0, bytes_written = 0, frames_seen = 0;
	CaptureMetadata meta;  // Under <mu>.
};

// Parses a whole capture. On a malformed or truncated record, logs the byte
// offset where it starts and returns false; <packets> then holds everything
// before it.
bool parse_capture_data(const uint8_t *data, size_t len, std::vector<CapturedPacket> *packets);

// If <metadata> is given, it is filled from the sidecar when there is one;
// a missing sidecar leaves it at the defaults.
bool read_capture_file(const std::string &filename, std::vector<CapturedPacket> *packets,
                       CaptureMetadata *metadata = nullptr);

#endif  // !defined(_PACKET_CAPTURE_H)
