// Licensed under the MIT License. See LICENSE file for details.

// Single translation unit holding the stb implementations
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
