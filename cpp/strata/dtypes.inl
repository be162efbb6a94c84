// Built-in dtypes: STRATA_DTYPE(identifier, kind, group bits, group size)
// Included with STRATA_DTYPE defined by the consumer.

STRATA_DTYPE(bool8, boolean, 8, 1)

STRATA_DTYPE(opaque8, opaque, 8, 1)
STRATA_DTYPE(opaque16, opaque, 16, 1)
STRATA_DTYPE(opaque32, opaque, 32, 1)
STRATA_DTYPE(opaque64, opaque, 64, 1)

STRATA_DTYPE(int4, signless_integer, 4, 1)
STRATA_DTYPE(sint4, signed_integer, 4, 1)
STRATA_DTYPE(uint4, unsigned_integer, 4, 1)
STRATA_DTYPE(int8, signless_integer, 8, 1)
STRATA_DTYPE(sint8, signed_integer, 8, 1)
STRATA_DTYPE(uint8, unsigned_integer, 8, 1)
STRATA_DTYPE(int16, signless_integer, 16, 1)
STRATA_DTYPE(sint16, signed_integer, 16, 1)
STRATA_DTYPE(uint16, unsigned_integer, 16, 1)
STRATA_DTYPE(int32, signless_integer, 32, 1)
STRATA_DTYPE(sint32, signed_integer, 32, 1)
STRATA_DTYPE(uint32, unsigned_integer, 32, 1)
STRATA_DTYPE(int64, signless_integer, 64, 1)
STRATA_DTYPE(sint64, signed_integer, 64, 1)
STRATA_DTYPE(uint64, unsigned_integer, 64, 1)

STRATA_DTYPE(float8_e4m3fn, floating, 8, 1)
STRATA_DTYPE(float8_e5m2, floating, 8, 1)
STRATA_DTYPE(float16, floating, 16, 1)
STRATA_DTYPE(bfloat16, floating, 16, 1)
STRATA_DTYPE(float32, floating, 32, 1)
STRATA_DTYPE(float64, floating, 64, 1)

STRATA_DTYPE(complex64, complex, 64, 1)
STRATA_DTYPE(complex128, complex, 128, 1)

// GGUF block quantized formats. Group bits cover the block scales.
STRATA_DTYPE(q4_0, block_quantized, 144, 32)
STRATA_DTYPE(q4_1, block_quantized, 160, 32)
STRATA_DTYPE(q5_0, block_quantized, 176, 32)
STRATA_DTYPE(q5_1, block_quantized, 192, 32)
STRATA_DTYPE(q8_0, block_quantized, 272, 32)
STRATA_DTYPE(q4_k, block_quantized, 1152, 256)
STRATA_DTYPE(q5_k, block_quantized, 1408, 256)
STRATA_DTYPE(q6_k, block_quantized, 1680, 256)
