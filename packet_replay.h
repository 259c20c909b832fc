#ifndef _PACKET_REPLAY_H
#define _PACKET_REPLAY_H 1

// Feeds a recorded packet capture through a UVCStream as if it came from
// the camera: packets are grouped into transfers of
// params.packets_per_transfer packets, and paced by their timestamps
// (scaled by the playback speed).

#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "packet_capture.h"
#include "stream_params.h"
#include "video_frame.h"

class UVCStream;

class PacketReplay {
public:
	// Does not take ownership of <stream>, which must outlive the replay.
	PacketReplay(std::vector<CapturedPacket> packets, const StreamParams &params, UVCStream *stream);
	~PacketReplay();

	// 1.0 is real time, 2.0 twice as fast; 0.0 means as fast as possible.
	// Takes effect at the next start().
	void set_speed(double speed) { this->speed = speed; }

	// Start over (with the stream reset) when reaching the end of the capture.
	void set_loop(bool loop) { this->loop = loop; }

	// Returns false if the replay is already running.
	bool start();

	// Returns false if the replay is not running.
	bool stop();

	bool running() const { return replay_thread.joinable() && !finished; }

	// Blocks until a non-looping replay has played everything.
	void wait();

	uint64_t transfers_replayed() const { return num_transfers; }
	uint64_t loops_completed() const { return num_loops; }

private:
	void replay_thread_func();
	bool replay_once();  // False if told to quit.
	void join_thread();

	const std::vector<CapturedPacket> packets;
	const StreamParams params;
	UVCStream *stream;
	double speed = 1.0;
	bool loop = false;

	std::thread replay_thread;
	std::atomic<bool> finished{true};

	std::mutex quit_mu;
	std::condition_variable quit_cond;
	bool should_quit = false;  // Under quit_mu.

	std::atomic<uint64_t> num_transfers{0};
	std::atomic<uint64_t> num_loops{0};
};

struct ReplayedFrame {
	FrameFormat format;
	bool valid;
	std::vector<uint8_t> data;
};

// Runs <packets> through a fresh stream, as fast as possible and on the
// calling thread, and returns a copy of every frame that came out.
std::vector<ReplayedFrame> replay_all_frames(const std::vector<CapturedPacket> &packets, const StreamParams &params);

#endif  // !defined(_PACKET_REPLAY_H)
