#include "frame_validator.h"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <algorithm>

#include "defs.h"
#include "uvc_header.h"

using namespace std;

ValidationLevel parse_validation_level(const string &name)
{
	string lower;
	for (char c : name) {
		lower.push_back(tolower((unsigned char)c));
	}
	if (lower == "strict") {
		return VALIDATION_STRICT;
	} else if (lower == "moderate") {
		return VALIDATION_MODERATE;
	} else if (lower == "minimal") {
		return VALIDATION_MINIMAL;
	} else if (lower == "off" || lower == "none" || lower == "disabled") {
		return VALIDATION_OFF;
	}
	fprintf(stderr, "Unknown validation level '%s', defaulting to 'strict'\n", name.c_str());
	return VALIDATION_STRICT;
}

const char *validation_level_name(ValidationLevel level)
{
	switch (level) {
	case VALIDATION_STRICT:
		return "strict";
	case VALIDATION_MODERATE:
		return "moderate";
	case VALIDATION_MINIMAL:
		return "minimal";
	case VALIDATION_OFF:
		return "off";
	}
	return "unknown";
}

ValidationLevel validation_level_from_env(ValidationLevel default_level)
{
	const char *value = getenv(VALIDATION_ENV_VAR);
	if (value == nullptr || value[0] == '\0') {
		return default_level;
	}
	return parse_validation_level(value);
}

float compute_row_difference(const uint8_t *data, size_t len, unsigned stride, unsigned height, unsigned luma_offset)
{
	if (height < 2 || stride == 0) {
		return 0.0f;
	}
	unsigned rows_to_check = min(3u, height - 1);
	uint64_t total_diff = 0;
	uint64_t samples = 0;

	for (unsigned row = 0; row < rows_to_check; ++row) {
		size_t row0_start = size_t(row) * stride;
		size_t row1_start = size_t(row + 1) * stride;

		// Every 16th pixel; luminance is every other byte in 4:2:2.
		for (size_t x = luma_offset; x < stride; x += 32) {
			if (row1_start + x >= len) {
				break;
			}
			int y0 = data[row0_start + x];
			int y1 = data[row1_start + x];
			total_diff += abs(y0 - y1);
			++samples;
		}
	}

	if (samples == 0) {
		return 0.0f;
	}
	return float(total_diff) / float(samples);
}

ValidationResult validate_raw_frame(const uint8_t *data, size_t len,
                                    unsigned width, unsigned height, unsigned stride,
                                    size_t expected_size, FrameFormat format,
                                    ValidationLevel level)
{
	ValidationResult result;
	result.actual_size = len;
	result.expected_size = expected_size;
	result.size_ratio = float(len) / float(max<size_t>(expected_size, 1));

	if (level == VALIDATION_OFF) {
		return result;
	}
	if (stride == 0) {
		stride = width * 2;
	}

	char buf[256];
	string reasons;
	auto add_reason = [&reasons](const char *reason) {
		if (!reasons.empty()) {
			reasons += "; ";
		}
		reasons += reason;
	};

	bool size_valid;
	if (level == VALIDATION_MINIMAL) {
		size_valid = result.size_ratio >= MINIMAL_SIZE_RATIO_MIN && result.size_ratio <= MINIMAL_SIZE_RATIO_MAX;
	} else {
		size_valid = result.size_ratio >= SIZE_RATIO_MIN && result.size_ratio <= SIZE_RATIO_MAX;
	}
	if (!size_valid) {
		snprintf(buf, sizeof(buf), "Size mismatch: %zu bytes (expected %zu, ratio %.2f)",
			len, expected_size, result.size_ratio);
		add_reason(buf);
	}

	if (level == VALIDATION_STRICT || level == VALIDATION_MODERATE) {
		// Allow being off by less than one row from the expected size.
		size_t diff = (len > expected_size) ? len - expected_size : expected_size - len;
		result.stride_aligned = (stride > 0 && len % stride == 0) || diff < stride;
		if (!result.stride_aligned) {
			snprintf(buf, sizeof(buf), "Stride misalignment: size %zu not aligned to stride %u",
				len, stride);
			add_reason(buf);
		}
	}

	bool row_diff_valid = true;
	if (level == VALIDATION_STRICT && height >= 4 && len >= size_t(stride) * 4) {
		unsigned luma_offset = (format == FRAME_FORMAT_UYVY) ? 1 : 0;
		result.has_avg_row_diff = true;
		result.avg_row_diff = compute_row_difference(data, len, stride, height, luma_offset);
		if (result.avg_row_diff > STRICT_ROW_DIFF_THRESHOLD) {
			snprintf(buf, sizeof(buf), "High row difference: %.1f (threshold %.0f)",
				result.avg_row_diff, STRICT_ROW_DIFF_THRESHOLD);
			add_reason(buf);
			row_diff_valid = false;
		}
	}

	result.valid = size_valid && result.stride_aligned && row_diff_valid;
	result.failure_reason = reasons;
	return result;
}

ValidationResult validate_mjpeg_frame(const uint8_t *data, size_t len, ValidationLevel level)
{
	ValidationResult result;
	result.actual_size = len;
	result.expected_size = len;
	result.size_ratio = 1.0f;
	if (level == VALIDATION_OFF) {
		return result;
	}
	if (!starts_with_jpeg_soi(data, len)) {
		result.valid = false;
		result.failure_reason = "Missing JPEG start-of-image marker";
	} else if (!ends_with_jpeg_eoi(data, len)) {
		result.valid = false;
		result.failure_reason = "Missing JPEG end-of-image marker";
	}
	return result;
}

void ValidationLogger::report(const ValidationResult &result, uint64_t frame_number)
{
	if (result.valid) {
		return;
	}
	++invalid_count;
	if (invalid_count <= LOG_FIRST_N || invalid_count % LOG_EVERY_N == 0) {
		if (result.has_avg_row_diff) {
			fprintf(stderr, "Frame %llu failed validation (%llu so far): %s [row diff %.1f, size ratio %.2f]\n",
				(unsigned long long)frame_number, (unsigned long long)invalid_count,
				result.failure_reason.c_str(), result.avg_row_diff, result.size_ratio);
		} else {
			fprintf(stderr, "Frame %llu failed validation (%llu so far): %s [size ratio %.2f]\n",
				(unsigned long long)frame_number, (unsigned long long)invalid_count,
				result.failure_reason.c_str(), result.size_ratio);
		}
	}
}
