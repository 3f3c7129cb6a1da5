#pragma once

// security parameter (size of a random seed in bits)
#define LAMBDA 128

// largest number of blocks in one message
#define MAX_BLOCKS 65536

// give up on rejection sampling after this many attempts
#define MAX_SAMPLE_ATTEMPTS 1000
