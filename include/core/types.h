/**
* @file   types.h
* @brief  Core types for the setupforge library
*/

#ifndef SETUPFORGE_TYPES_H
#define SETUPFORGE_TYPES_H

#include <stddef.h>

typedef unsigned char setupforge_byte_t; /**< Byte type */
typedef unsigned int setupforge_uint_t; /**< Double word type */
typedef unsigned long long setupforge_ulong_t; /**< Quad word type */
typedef signed int setupforge_int_t; /**< Signed double word type */
typedef char setupforge_char_t; /**< Character type */
typedef char* setupforge_string_t; /**< String type */
typedef const char* setupforge_cstring_t; /**< Constant string type */
typedef size_t setupforge_size_t; /**< Size type */

#endif
