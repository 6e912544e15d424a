#pragma once

// Chunk, boundary, statistics and report types in one include.
#include "docsplit_core/types/chunk.hpp"
#include "docsplit_core/types/stats.hpp"
