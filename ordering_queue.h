#ifndef _ORDERING_QUEUE_H
#define _ORDERING_QUEUE_H 1

// Holds extracted payloads until everything before them has been applied,
// so that transfers completing out of order never reach the frame buffer
// out of order. Not thread-safe by itself; UVCStream keeps it under the
// same lock as the rest of the assembly state.
//
// There is deliberately no timeout: if a sequence number never shows up,
// draining stops there until someone calls skip_gap().

#include <stddef.h>
#include <stdint.h>
#include <map>
#include <vector>

#include "payload_extractor.h"

class OrderingQueue {
public:
	// Payloads with a sequence number below <next_expected> at the time of
	// the next drain are thrown away then. Inserting a sequence number that
	// is already queued replaces nothing; the duplicate is dropped and
	// false is returned.
	bool insert(UrbPayload payload);

	// Removes the longest run of consecutive sequence numbers starting at
	// *next_expected, appends them in order to <out>, and advances
	// *next_expected past them. Returns the number of payloads appended.
	size_t drain_ready(uint64_t *next_expected, std::vector<UrbPayload> *out);

	// Moves *next_expected up to the lowest queued sequence number, giving
	// up on everything in between. Returns how many sequence numbers were
	// skipped (0 if there was no gap, or nothing is queued).
	uint64_t skip_gap(uint64_t *next_expected);

	size_t size() const { return pending.size(); }
	bool empty() const { return pending.empty(); }
	uint64_t lowest_pending() const;  // Only valid if !empty().
	uint64_t dropped_stale() const { return num_dropped_stale; }
	void clear();

private:
	std::map<uint64_t, UrbPayload> pending;
	uint64_t num_dropped_stale = 0;
};

#endif  // !defined(_ORDERING_QUEUE_H)
