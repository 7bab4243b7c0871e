// Test unit: a valid shared library without the berth entry point.

extern "C" __attribute__((visibility("default"))) int berth_unrelated_symbol() { return 42; }
