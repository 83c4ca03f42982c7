/**
 * @file bitbuffer.cpp
 * @brief BitBuffer compilation unit.
 *
 * BitBuffer is implemented in the header so bit reads can be inlined into
 * the codecs using them. This file checks the header compiles on its own.
 *
 * @see include/lazybits/bitbuffer.hpp for the full implementation
 */

#include <lazybits/bitbuffer.hpp>

// All implementation is in the header (inline functions)
