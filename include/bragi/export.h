#pragma once

/**
 * @file export.h
 * @brief Export markers for the Bragi library
 *
 * The shared library is built with default symbol visibility, so BRAGI_API
 * only marks the public surface and expands to nothing.
 */

#define BRAGI_API

// For classes that should not be exported (internal use only)
#define BRAGI_INTERNAL
