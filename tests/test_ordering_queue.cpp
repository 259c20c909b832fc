// Tests for putting out-of-order transfer completions back in order.

#include <stdint.h>
#include <stdio.h>
#include <algorithm>
#include <random>
#include <vector>

#include "ordering_queue.h"

using namespace std;


static UrbPayload
payload_with_sequence(uint64_t sequence)
{
	UrbPayload payload;
	payload.sequence = sequence;
	payload.data.push_back(sequence & 0xff);
	return payload;
}


static bool
test_in_order_drain()
{
	printf("Test: Out-of-order inserts drain in order... ");

	OrderingQueue queue;
	uint64_t next_expected = 0;
	vector<UrbPayload> out;

	queue.insert(payload_with_sequence(2));
	queue.insert(payload_with_sequence(1));
	if (queue.drain_ready(&next_expected, &out) != 0 || next_expected != 0) {
		printf("FAIL (drained past a gap)\n");
		return false;
	}

	queue.insert(payload_with_sequence(0));
	if (queue.drain_ready(&next_expected, &out) != 3 || next_expected != 3) {
		printf("FAIL (drained %zu, next %llu)\n", out.size(), (unsigned long long)next_expected);
		return false;
	}
	for (size_t i = 0; i < out.size(); ++i) {
		if (out[i].sequence != i) {
			printf("FAIL (position %zu has sequence %llu)\n", i, (unsigned long long)out[i].sequence);
			return false;
		}
	}
	if (!queue.empty()) {
		printf("FAIL (queue not empty)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_gap_blocks()
{
	printf("Test: A missing sequence number blocks draining... ");

	OrderingQueue queue;
	uint64_t next_expected = 0;
	vector<UrbPayload> out;

	queue.insert(payload_with_sequence(0));
	queue.insert(payload_with_sequence(2));
	queue.insert(payload_with_sequence(3));
	queue.drain_ready(&next_expected, &out);
	if (out.size() != 1 || next_expected != 1 || queue.size() != 2) {
		printf("FAIL (drained %zu, next %llu)\n", out.size(), (unsigned long long)next_expected);
		return false;
	}
	if (queue.lowest_pending() != 2) {
		printf("FAIL (lowest pending %llu)\n", (unsigned long long)queue.lowest_pending());
		return false;
	}

	// Still stuck, however many times we look.
	for (int i = 0; i < 5; ++i) {
		if (queue.drain_ready(&next_expected, &out) != 0) {
			printf("FAIL (drained without sequence 1)\n");
			return false;
		}
	}

	queue.insert(payload_with_sequence(1));
	if (queue.drain_ready(&next_expected, &out) != 3 || next_expected != 4) {
		printf("FAIL (after filling gap: next %llu)\n", (unsigned long long)next_expected);
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_duplicates_and_stale()
{
	printf("Test: Duplicate and stale sequence numbers dropped... ");

	OrderingQueue queue;
	uint64_t next_expected = 0;
	vector<UrbPayload> out;

	if (!queue.insert(payload_with_sequence(1))) {
		printf("FAIL (first insert refused)\n");
		return false;
	}
	if (queue.insert(payload_with_sequence(1))) {
		printf("FAIL (duplicate accepted)\n");
		return false;
	}
	queue.insert(payload_with_sequence(0));
	queue.drain_ready(&next_expected, &out);
	if (out.size() != 2) {
		printf("FAIL (drained %zu)\n", out.size());
		return false;
	}

	// Sequence 0 again, after it has been applied.
	queue.insert(payload_with_sequence(0));
	out.clear();
	if (queue.drain_ready(&next_expected, &out) != 0 || !out.empty() || next_expected != 2) {
		printf("FAIL (stale payload came out)\n");
		return false;
	}
	if (queue.dropped_stale() != 1 || !queue.empty()) {
		printf("FAIL (dropped_stale %llu)\n", (unsigned long long)queue.dropped_stale());
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_skip_gap()
{
	printf("Test: Explicit gap skip... ");

	OrderingQueue queue;
	uint64_t next_expected = 0;
	vector<UrbPayload> out;

	// Nothing queued, nothing to skip.
	if (queue.skip_gap(&next_expected) != 0 || next_expected != 0) {
		printf("FAIL (skipped on empty queue)\n");
		return false;
	}

	queue.insert(payload_with_sequence(5));
	queue.insert(payload_with_sequence(6));
	uint64_t skipped = queue.skip_gap(&next_expected);
	if (skipped != 5 || next_expected != 5) {
		printf("FAIL (skipped %llu, next %llu)\n", (unsigned long long)skipped, (unsigned long long)next_expected);
		return false;
	}
	if (queue.drain_ready(&next_expected, &out) != 2 || next_expected != 7) {
		printf("FAIL (drain after skip)\n");
		return false;
	}

	// No gap: no skip.
	queue.insert(payload_with_sequence(7));
	if (queue.skip_gap(&next_expected) != 0) {
		printf("FAIL (skipped without a gap)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_empty_drain_is_idempotent()
{
	printf("Test: Draining nothing leaves the cursor alone... ");

	OrderingQueue queue;
	uint64_t next_expected = 42;
	vector<UrbPayload> out;
	for (int i = 0; i < 3; ++i) {
		if (queue.drain_ready(&next_expected, &out) != 0 || next_expected != 42 || !out.empty()) {
			printf("FAIL (next %llu)\n", (unsigned long long)next_expected);
			return false;
		}
	}

	printf("OK\n");
	return true;
}


static bool
test_random_permutations()
{
	printf("Test: Random completion orders... ");

	mt19937 rng(1234);
	for (int round = 0; round < 50; ++round) {
		const unsigned num_payloads = 100;
		vector<uint64_t> order;
		for (unsigned i = 0; i < num_payloads; ++i) {
			order.push_back(i);
		}
		shuffle(order.begin(), order.end(), rng);

		OrderingQueue queue;
		uint64_t next_expected = 0;
		vector<UrbPayload> out;
		for (uint64_t sequence : order) {
			queue.insert(payload_with_sequence(sequence));
			queue.drain_ready(&next_expected, &out);
		}

		if (out.size() != num_payloads || next_expected != num_payloads) {
			printf("FAIL (round %d: %zu drained)\n", round, out.size());
			return false;
		}
		for (size_t i = 0; i < out.size(); ++i) {
			if (out[i].sequence != i) {
				printf("FAIL (round %d: position %zu has %llu)\n", round, i,
					(unsigned long long)out[i].sequence);
				return false;
			}
		}
	}

	printf("OK\n");
	return true;
}


int
main(int argc, char **argv)
{
	printf("\n");
	printf("===========================================\n");
	printf("Ordering Queue Tests\n");
	printf("===========================================\n\n");

	int passed = 0;
	int failed = 0;

	bool (*tests[])() = {
		test_in_order_drain,
		test_gap_blocks,
		test_duplicates_and_stale,
		test_skip_gap,
		test_empty_drain_is_idempotent,
		test_random_permutations,
	};
	for (bool (*test)() : tests) {
		if (test())
			passed++;
		else
			failed++;
	}

	printf("\n");
	printf("===========================================\n");
	printf("Results: %d passed, %d failed\n", passed, failed);
	printf("===========================================\n\n");

	return (failed == 0) ? 0 : 1;
}
