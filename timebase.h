#ifndef _TIMEBASE_H
#define _TIMEBASE_H 1

// Timebase for muxed output. Frame timestamps are taken in microseconds
// (steady clock, at the time the frame was completed) and rescaled to this.
// 90 kHz is what most muxers like best, and keeps frame durations at the
// usual camera rates (15/25/30/60 fps) exact.
#define TIMEBASE 90000

#define TIMESTAMP_TIMEBASE 1000000

#endif  // !defined(_TIMEBASE_H)
