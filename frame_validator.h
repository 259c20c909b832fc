#ifndef _FRAME_VALIDATOR_H
#define _FRAME_VALIDATOR_H 1

// Heuristics for spotting corrupted frames from cheap USB cameras:
// frames of the wrong size, frames that do not end on a row boundary,
// and frames where adjacent rows differ wildly (a frame split mid-row
// shows up as horizontal banding or diagonal shearing).
//
// Validation only ever flags frames; it never drops them.

#include <stddef.h>
#include <stdint.h>
#include <string>

#include "video_frame.h"

enum ValidationLevel {
	VALIDATION_STRICT,  // Size, stride alignment and row similarity.
	VALIDATION_MODERATE,  // Size and stride alignment.
	VALIDATION_MINIMAL,  // Only gross size mismatches.
	VALIDATION_OFF,
};

#define STRICT_ROW_DIFF_THRESHOLD 40.0f
#define SIZE_RATIO_MIN 0.9f
#define SIZE_RATIO_MAX 1.1f
#define MINIMAL_SIZE_RATIO_MIN 0.5f
#define MINIMAL_SIZE_RATIO_MAX 2.0f

// Case-insensitive. Unknown names log a warning and give VALIDATION_STRICT.
ValidationLevel parse_validation_level(const std::string &name);
const char *validation_level_name(ValidationLevel level);

// Reads the level from the environment (see VALIDATION_ENV_VAR in defs.h),
// or returns <default_level> if it is not set.
ValidationLevel validation_level_from_env(ValidationLevel default_level);

struct ValidationResult {
	bool valid = true;
	bool has_avg_row_diff = false;
	float avg_row_diff = 0.0f;
	size_t actual_size = 0;
	size_t expected_size = 0;
	float size_ratio = 0.0f;
	bool stride_aligned = true;
	std::string failure_reason;  // Empty if valid.
};

// <stride> is bytes per row; 0 means width * 2.
ValidationResult validate_raw_frame(const uint8_t *data, size_t len,
                                    unsigned width, unsigned height, unsigned stride,
                                    size_t expected_size, FrameFormat format,
                                    ValidationLevel level);

// MJPEG frames only get a structural check (start-of-image and end-of-image
// markers in place), unless the level is VALIDATION_OFF.
ValidationResult validate_mjpeg_frame(const uint8_t *data, size_t len, ValidationLevel level);

// Average absolute luminance difference between vertically adjacent samples,
// taken every 32 bytes over rows 0-3 (the three pairs 0/1, 1/2 and 2/3;
// fewer if the frame is shorter). <luma_offset> is 0 for YUY2 and 1 for UYVY.
float compute_row_difference(const uint8_t *data, size_t len, unsigned stride, unsigned height, unsigned luma_offset);

// Logs validation failures, but only the first LOG_FIRST_N and then every
// LOG_EVERY_N-th, so a camera that is broken all the time does not flood
// the log.
class ValidationLogger {
public:
	void report(const ValidationResult &result, uint64_t frame_number);
	uint64_t num_invalid() const { return invalid_count; }
	void reset() { invalid_count = 0; }

private:
	uint64_t invalid_count = 0;
};

#endif  // !defined(_FRAME_VALIDATOR_H)
