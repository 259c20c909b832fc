// Tests for the corruption heuristics at each validation level.

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <algorithm>
#include <vector>

#include "defs.h"
#include "frame_validator.h"
#include "packet_generator.h"

using namespace std;

#define WIDTH 640
#define HEIGHT 480
#define STRIDE (WIDTH * 2)
#define FRAME_SIZE (STRIDE * HEIGHT)


// A gradient frame <extra_rows> rows longer (or shorter, if negative) than
// it should be, plus <extra_bytes>.
static vector<uint8_t>
sized_frame(int extra_rows, int extra_bytes)
{
	vector<uint8_t> frame = make_raw_frame(WIDTH, HEIGHT, PATTERN_GRADIENT);
	frame.resize(FRAME_SIZE + extra_rows * STRIDE + extra_bytes, 100);
	return frame;
}


static ValidationResult
validate(const vector<uint8_t> &frame, ValidationLevel level)
{
	return validate_raw_frame(frame.data(), frame.size(), WIDTH, HEIGHT, 0, FRAME_SIZE, FRAME_FORMAT_YUY2, level);
}


static bool
test_size_ratio_strict()
{
	printf("Test: Strict size ratio bounds... ");

	// 144 extra rows = ratio 1.3; 10 extra rows = ratio 1.02.
	vector<uint8_t> oversized = sized_frame(144, 0);
	ValidationResult result = validate(oversized, VALIDATION_STRICT);
	if (result.valid || result.size_ratio < 1.29f || result.size_ratio > 1.31f) {
		printf("FAIL (1.3 accepted, ratio %.3f)\n", result.size_ratio);
		return false;
	}
	if (result.failure_reason.empty()) {
		printf("FAIL (no reason given)\n");
		return false;
	}

	vector<uint8_t> slightly_over = sized_frame(10, 0);
	result = validate(slightly_over, VALIDATION_STRICT);
	if (!result.valid || result.size_ratio < 1.01f || result.size_ratio > 1.03f) {
		printf("FAIL (1.02 rejected: %s)\n", result.failure_reason.c_str());
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_size_ratio_moderate()
{
	printf("Test: Moderate uses the same size bounds as strict... ");

	if (validate(sized_frame(144, 0), VALIDATION_MODERATE).valid) {
		printf("FAIL (1.3 accepted)\n");
		return false;
	}
	if (!validate(sized_frame(10, 0), VALIDATION_MODERATE).valid) {
		printf("FAIL (1.02 rejected)\n");
		return false;
	}
	if (validate(sized_frame(-96, 0), VALIDATION_MODERATE).valid) {
		printf("FAIL (0.8 accepted)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_size_ratio_minimal()
{
	printf("Test: Minimal only flags gross size mismatches... ");

	if (!validate(sized_frame(144, 0), VALIDATION_MINIMAL).valid) {
		printf("FAIL (1.3 rejected)\n");
		return false;
	}
	if (validate(sized_frame(HEIGHT * 2, 0), VALIDATION_MINIMAL).valid) {
		printf("FAIL (3.0 accepted)\n");
		return false;
	}
	if (validate(sized_frame(-HEIGHT * 3 / 4, 0), VALIDATION_MINIMAL).valid) {
		printf("FAIL (0.25 accepted)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_off_accepts_everything()
{
	printf("Test: Off accepts everything... ");

	vector<uint8_t> garbage(17, 0);
	ValidationResult result = validate(garbage, VALIDATION_OFF);
	if (!result.valid || !result.failure_reason.empty()) {
		printf("FAIL (raw frame rejected)\n");
		return false;
	}
	if (!validate_mjpeg_frame(garbage.data(), garbage.size(), VALIDATION_OFF).valid) {
		printf("FAIL (MJPEG frame rejected)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_stride_alignment()
{
	printf("Test: Stride misalignment... ");

	// Three rows and 100 bytes too long: inside the size bounds, but not
	// a whole number of rows, and off by more than one row.
	vector<uint8_t> misaligned = sized_frame(3, 100);
	ValidationResult result = validate(misaligned, VALIDATION_MODERATE);
	if (result.valid || result.stride_aligned) {
		printf("FAIL (moderate accepted)\n");
		return false;
	}
	if (!validate(misaligned, VALIDATION_MINIMAL).valid) {
		printf("FAIL (minimal rejected)\n");
		return false;
	}

	// Less than one row off is fine.
	vector<uint8_t> nearly = sized_frame(0, 100);
	result = validate(nearly, VALIDATION_MODERATE);
	if (!result.valid || !result.stride_aligned) {
		printf("FAIL (partial row rejected)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_row_difference()
{
	printf("Test: Banded frames fail the row similarity check... ");

	vector<uint8_t> banded = make_raw_frame(WIDTH, HEIGHT, PATTERN_BANDED);
	ValidationResult result = validate(banded, VALIDATION_STRICT);
	if (result.valid || !result.has_avg_row_diff || result.avg_row_diff <= STRICT_ROW_DIFF_THRESHOLD) {
		printf("FAIL (strict accepted, row diff %.1f)\n", result.avg_row_diff);
		return false;
	}

	// Only strict looks at the rows.
	result = validate(banded, VALIDATION_MODERATE);
	if (!result.valid || result.has_avg_row_diff) {
		printf("FAIL (moderate rejected)\n");
		return false;
	}

	vector<uint8_t> smooth = make_raw_frame(WIDTH, HEIGHT, PATTERN_GRADIENT);
	result = validate(smooth, VALIDATION_STRICT);
	if (!result.valid || result.avg_row_diff > 2.0f) {
		printf("FAIL (gradient rejected, row diff %.1f)\n", result.avg_row_diff);
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_uyvy_luma()
{
	printf("Test: UYVY row check looks at the luma byte... ");

	// In UYVY, the chroma bytes of a banded frame are all alike; only
	// sampling at offset 1 sees the bands.
	vector<uint8_t> banded = make_raw_frame(WIDTH, HEIGHT, PATTERN_BANDED, true);
	ValidationResult result = validate_raw_frame(banded.data(), banded.size(), WIDTH, HEIGHT, 0,
		FRAME_SIZE, FRAME_FORMAT_UYVY, VALIDATION_STRICT);
	if (result.valid || result.avg_row_diff <= STRICT_ROW_DIFF_THRESHOLD) {
		printf("FAIL (row diff %.1f)\n", result.avg_row_diff);
		return false;
	}
	if (compute_row_difference(banded.data(), banded.size(), STRIDE, HEIGHT, 0) != 0.0f) {
		printf("FAIL (chroma bytes differ)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_row_difference_rows_checked()
{
	printf("Test: Row difference covers rows 0-3 only... ");

	const unsigned stride = 64, height = 6;
	vector<uint8_t> frame(stride * height, 100);

	// Row 4 is not part of any checked pair.
	fill(frame.begin() + 4 * stride, frame.begin() + 5 * stride, 200);
	float diff = compute_row_difference(frame.data(), frame.size(), stride, height, 0);
	if (diff != 0.0f) {
		printf("FAIL (row 4 counted, diff %.1f)\n", diff);
		return false;
	}

	// Row 3 is, through the 2/3 pair: two samples of 100 out of six.
	fill(frame.begin() + 3 * stride, frame.begin() + 4 * stride, 200);
	diff = compute_row_difference(frame.data(), frame.size(), stride, height, 0);
	if (diff < 33.0f || diff > 34.0f) {
		printf("FAIL (row 3, diff %.1f)\n", diff);
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_mjpeg_structure()
{
	printf("Test: MJPEG structural check... ");

	vector<uint8_t> jpeg = make_jpeg(1000, 1);
	if (!validate_mjpeg_frame(jpeg.data(), jpeg.size(), VALIDATION_STRICT).valid) {
		printf("FAIL (good JPEG rejected)\n");
		return false;
	}
	jpeg.pop_back();
	if (validate_mjpeg_frame(jpeg.data(), jpeg.size(), VALIDATION_MINIMAL).valid) {
		printf("FAIL (missing EOI accepted)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_level_names()
{
	printf("Test: Validation level names... ");

	if (parse_validation_level("strict") != VALIDATION_STRICT ||
	    parse_validation_level("Moderate") != VALIDATION_MODERATE ||
	    parse_validation_level("MINIMAL") != VALIDATION_MINIMAL ||
	    parse_validation_level("off") != VALIDATION_OFF ||
	    parse_validation_level("none") != VALIDATION_OFF ||
	    parse_validation_level("Disabled") != VALIDATION_OFF) {
		printf("FAIL (known names)\n");
		return false;
	}
	if (parse_validation_level("paranoid") != VALIDATION_STRICT) {
		printf("FAIL (unknown name)\n");
		return false;
	}
	for (ValidationLevel level : { VALIDATION_STRICT, VALIDATION_MODERATE, VALIDATION_MINIMAL, VALIDATION_OFF }) {
		if (parse_validation_level(validation_level_name(level)) != level) {
			printf("FAIL (%s does not round-trip)\n", validation_level_name(level));
			return false;
		}
	}

	printf("OK\n");
	return true;
}


static bool
test_level_from_env()
{
	printf("Test: Validation level from the environment... ");

	unsetenv(VALIDATION_ENV_VAR);
	if (validation_level_from_env(VALIDATION_MINIMAL) != VALIDATION_MINIMAL) {
		printf("FAIL (default not used)\n");
		return false;
	}
	setenv(VALIDATION_ENV_VAR, "moderate", 1);
	if (validation_level_from_env(VALIDATION_STRICT) != VALIDATION_MODERATE) {
		printf("FAIL (variable not used)\n");
		unsetenv(VALIDATION_ENV_VAR);
		return false;
	}
	unsetenv(VALIDATION_ENV_VAR);

	printf("OK\n");
	return true;
}


static bool
test_logger_counts()
{
	printf("Test: Validation logger counts failures... ");

	ValidationLogger logger;
	ValidationResult good;
	ValidationResult bad;
	bad.valid = false;
	bad.failure_reason = "test";

	for (int i = 0; i < 250; ++i) {
		logger.report((i % 2) ? bad : good, i);
	}
	if (logger.num_invalid() != 125) {
		printf("FAIL (%llu invalid)\n", (unsigned long long)logger.num_invalid());
		return false;
	}
	logger.reset();
	if (logger.num_invalid() != 0) {
		printf("FAIL (not reset)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


int
main(int argc, char **argv)
{
	printf("\n");
	printf("===========================================\n");
	printf("Frame Validator Tests\n");
	printf("===========================================\n\n");

	int passed = 0;
	int failed = 0;

	bool (*tests[])() = {
		test_size_ratio_strict,
		test_size_ratio_moderate,
		test_size_ratio_minimal,
		test_off_accepts_everything,
		test_stride_alignment,
		test_row_difference,
		test_uyvy_luma,
		test_row_difference_rows_checked,
		test_mjpeg_structure,
		test_level_names,
		test_level_from_env,
		test_logger_counts,
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
