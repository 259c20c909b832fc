#include "ordering_queue.h"

#include <stdio.h>
#include <utility>

using namespace std;

bool OrderingQueue::insert(UrbPayload payload)
{
	uint64_t sequence = payload.sequence;
	if (pending.count(sequence)) {
		fprintf(stderr, "Duplicate payload sequence %llu (dropped)\n",
			(unsigned long long)sequence);
		return false;
	}
	pending.insert(make_pair(sequence, move(payload)));
	return true;
}

size_t OrderingQueue::drain_ready(uint64_t *next_expected, vector<UrbPayload> *out)
{
	// Anything below the cursor has been applied or skipped already.
	while (!pending.empty() && pending.begin()->first < *next_expected) {
		fprintf(stderr, "Stale payload sequence %llu (expected %llu, dropped)\n",
			(unsigned long long)pending.begin()->first,
			(unsigned long long)*next_expected);
		pending.erase(pending.begin());
		++num_dropped_stale;
	}

	size_t num_drained = 0;
	while (!pending.empty() && pending.begin()->first == *next_expected) {
		out->push_back(move(pending.begin()->second));
		pending.erase(pending.begin());
		++*next_expected;
		++num_drained;
	}
	return num_drained;
}

uint64_t OrderingQueue::skip_gap(uint64_t *next_expected)
{
	if (pending.empty() || pending.begin()->first <= *next_expected) {
		return 0;
	}
	uint64_t skipped = pending.begin()->first - *next_expected;
	*next_expected = pending.begin()->first;
	return skipped;
}

uint64_t OrderingQueue::lowest_pending() const
{
	return pending.begin()->first;
}

void OrderingQueue::clear()
{
	pending.clear();
}
